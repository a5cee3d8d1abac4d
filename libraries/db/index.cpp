#include <mart/db/object_database.hpp>

namespace mart { namespace db {

   void base_primary_index::save_undo( const object& obj )
   { _db.save_undo( obj ); }

   void base_primary_index::on_add( const object& obj )
   { _db.save_undo_add( obj ); }

   void base_primary_index::on_remove( const object& obj )
   { _db.save_undo_remove( obj ); }

} } // mart::db
