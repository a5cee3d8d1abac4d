#pragma once
#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#define MART_DB_MAX_INSTANCE_ID  (uint64_t(-1)>>16)

namespace mart { namespace db {
   using  std::shared_ptr;
   using  std::unique_ptr;
   using  std::vector;
   using  std::string;
   using  fc::variant;
   using  fc::unsigned_int;

   /**
    *  Objects are divided into id spaces, each with its own sequence of type
    *  ids, and every type has its own sequence of instance numbers.
    */
   enum id_space_type
   {
      /** objects that operations refer to directly */
      protocol_ids          = 1,
      /** objects that exist only to support evaluation, such as balances and indexes */
      implementation_ids    = 2
   };

   struct object_id_type
   {
      object_id_type( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> 48 == 0, "instance overflow", ("instance",i) );
         number = (uint64_t(s)<<56) | (uint64_t(t)<<48) | i;
      }
      object_id_type(){ number = 0; }

      uint8_t  space()const       { return number >> 56;              }
      uint8_t  type()const        { return number >> 48 & 0x00ff;     }
      uint16_t space_type()const  { return number >> 48;              }
      uint64_t instance()const    { return number & MART_DB_MAX_INSTANCE_ID; }
      bool     is_null()const     { return number == 0; }
      operator uint64_t()const    { return number; }

      friend bool  operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool  operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool  operator < ( const object_id_type& a, const object_id_type& b )  { return a.number < b.number; }

      object_id_type& operator++(int) { ++number; return *this; }
      object_id_type& operator++()    { ++number; return *this; }

      friend object_id_type operator+(const object_id_type& a, int delta ) {
         return object_id_type( a.space(), a.type(), a.instance() + delta );
      }
      friend size_t hash_value( object_id_type v ) { return std::hash<uint64_t>()(v.number); }

      uint64_t                   number;
   };

   class object;
   class object_database;

   template<uint8_t SpaceID, uint8_t TypeID, typename T = object>
   struct object_id
   {
      typedef T type;
      static const uint8_t space_id = SpaceID;
      static const uint8_t type_id = TypeID;

      object_id(){}
      object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( (i >> 48) == 0 );
      }
      object_id( object_id_type id ):instance(id.instance())
      {
         FC_ASSERT( id.space() == SpaceID && id.type() == TypeID, "wrong object type", ("id",id.number) );
      }

      operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance.value ); }
      operator uint64_t()const { return object_id_type( *this ).number; }

      template<typename DB>
      const T& operator()(const DB& db)const { return db.get(*this); }

      friend bool  operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool  operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool  operator == ( const object_id_type& a, const object_id& b ) { return a == object_id_type(b); }
      friend bool  operator == ( const object_id& b, const object_id_type& a ) { return a == object_id_type(b); }
      friend bool  operator < ( const object_id& a, const object_id& b ) { return a.instance.value < b.instance.value; }

      unsigned_int instance;
   };

} } // mart::db

FC_REFLECT_ENUM( mart::db::id_space_type, (protocol_ids)(implementation_ids) )
FC_REFLECT( mart::db::object_id_type, (number) )

// object_id is reflected by hand because of its non-type template parameters
namespace fc {

template<uint8_t SpaceID, uint8_t TypeID, typename T>
struct get_typename<mart::db::object_id<SpaceID,TypeID,T>>
{
   static const char* name() {
      static std::string _str = string("mart::db::object_id<")+fc::to_string(SpaceID) + ":" + fc::to_string(TypeID)+">";
      return _str.c_str();
   }
};

template<uint8_t SpaceID, uint8_t TypeID, typename T>
struct reflector<mart::db::object_id<SpaceID,TypeID,T> >
{
    typedef mart::db::object_id<SpaceID,TypeID,T> type;
    typedef fc::true_type  is_defined;
    typedef fc::false_type is_enum;
    enum  member_count_enum {
      local_member_count = 1,
      total_member_count = 1
    };
    template<typename Visitor>
    static inline void visit( const Visitor& visitor )
    {
       typedef decltype(((type*)nullptr)->instance) member_type;
       visitor.TEMPLATE operator()<member_type,type,&type::instance>( "instance" );
    }
};

inline void to_variant( const mart::db::object_id_type& var,  fc::variant& vo )
{
   vo = fc::to_string(var.space()) + "." + fc::to_string(var.type()) + "." + fc::to_string(var.instance());
}

inline void from_variant( const fc::variant& var,  mart::db::object_id_type& vo )
{ try {
   vo.number = 0;
   const auto& s = var.get_string();
   auto first_dot = s.find('.');
   auto second_dot = s.find('.',first_dot+1);
   FC_ASSERT( first_dot != second_dot );
   FC_ASSERT( first_dot != 0 && first_dot != std::string::npos );
   vo.number = fc::to_uint64(s.substr( second_dot+1 ));
   FC_ASSERT( vo.number <= MART_DB_MAX_INSTANCE_ID );
   auto space_id = fc::to_uint64( s.substr( 0, first_dot ) );
   FC_ASSERT( space_id <= 0xff );
   auto type_id =  fc::to_uint64( s.substr( first_dot+1, second_dot-first_dot-1 ) );
   FC_ASSERT( type_id <= 0xff );
   vo.number |= (space_id << 56) | (type_id << 48);
} FC_CAPTURE_AND_RETHROW( (var) ) }

template<uint8_t SpaceID, uint8_t TypeID, typename T>
void to_variant( const mart::db::object_id<SpaceID,TypeID,T>& var,  fc::variant& vo )
{
   vo = fc::to_string(SpaceID) + "." + fc::to_string(TypeID) + "." + fc::to_string(var.instance.value);
}

template<uint8_t SpaceID, uint8_t TypeID, typename T>
void from_variant( const fc::variant& var,  mart::db::object_id<SpaceID,TypeID,T>& vo )
{ try {
   const auto& s = var.get_string();
   auto first_dot = s.find('.');
   auto second_dot = s.find('.',first_dot+1);
   FC_ASSERT( first_dot != second_dot );
   FC_ASSERT( first_dot != 0 && first_dot != std::string::npos );
   FC_ASSERT( fc::to_uint64( s.substr( 0, first_dot ) ) == SpaceID &&
              fc::to_uint64( s.substr( first_dot+1, second_dot-first_dot-1 ) ) == TypeID );
   vo.instance = fc::to_uint64(s.substr( second_dot+1 ));
} FC_CAPTURE_AND_RETHROW( (var) ) }

} // namespace fc

namespace std {
   template <> struct hash<mart::db::object_id_type>
   {
      size_t operator()(const mart::db::object_id_type& x) const
      {
         return std::hash<uint64_t>()(x.number);
      }
   };
}
