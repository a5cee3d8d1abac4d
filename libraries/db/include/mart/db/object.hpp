#pragma once
#include <mart/db/object_id.hpp>
#include <fc/io/raw.hpp>

namespace mart { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  The object is the level at which undo operations are performed.  Every
    *  object is assigned a unique and sequential id by the index that owns it,
    *  within the space and type that the derived class declares.
    *
    *  All objects must be reflected with FC_REFLECT and be copy constructable
    *  and assignable.  Objects should refer to one another by id or by key and
    *  stay cheap to copy, since the undo database clones an object before the
    *  first modification in every session.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static const uint8_t space_id = 0;
         static const uint8_t type_id  = 0;

         // serialized
         object_id_type          id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const  = 0;
   };

   template<typename DerivedClass>
   class abstract_object : public object
   {
      public:
         virtual unique_ptr<object> clone()const
         {
            return unique_ptr<object>(new DerivedClass( *static_cast<const DerivedClass*>(this) ));
         }

         virtual void    move_from( object& obj )
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         virtual variant to_variant()const { return variant( static_cast<const DerivedClass&>(*this) ); }
   };

} } // mart::db

FC_REFLECT( mart::db::object, (id) )
