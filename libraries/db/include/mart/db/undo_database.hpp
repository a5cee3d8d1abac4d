#pragma once
#include <mart/db/object.hpp>
#include <fc/container/flat.hpp>
#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <deque>
#include <unordered_map>

namespace mart { namespace db {

   using std::unordered_map;
   using fc::flat_set;

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Sessions nest: every session owns the newest undo state on the stack, and
    * must be undone, merged into its parent or committed before the session
    * started ahead of it.
    */
   class undo_database
   {
      public:
         undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session() {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch ( const fc::exception& e )
                  {
                     elog( "unable to undo session: ${e}", ("e",e.to_detail_string() ) );
                  }
               }
               /** keeps the changes and forgets how to undo them */
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               /** folds the changes into the enclosing session */
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv )
               {
                  if( this == &mv ) return *this;
                  if( _apply_undo ) _db.undo();
                  _apply_undo = mv._apply_undo;
                  mv._apply_undo = false;
                  return *this;
               }

            private:
               friend class undo_database;
               session(undo_database& db, bool apply_undo): _db(db),_apply_undo(apply_undo) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         void    disable();
         void    enable();
         bool    enabled()const { return !_disabled; }

         session start_undo_session();
         /**
          * This should be called just after an object is created
          */
         void on_create( const object& obj );
         /**
          * This should be called just before an object is modified
          *
          * If it's a new object as of this undo state, its pre-modification value is not stored, because prior to this
          * undo state, it did not exist.
          */
         void on_modify( const object& obj );
         /**
          * This should be called just before an object is removed.
          *
          * Removing an object created in this undo state forgets it entirely, so that undoing the state does not try
          * to remove it a second time.
          */
         void on_remove( const object& obj );

         size_t  size()const { return _stack.size(); }

      private:
         void undo();
         void merge();
         void commit();

         struct undo_state
         {
            unordered_map<object_id_type, unique_ptr<object> > old_values;
            unordered_map<object_id_type, object_id_type>      old_index_next_ids;
            flat_set<object_id_type>                           new_ids;
            unordered_map<object_id_type, unique_ptr<object> > removed;
         };

         bool                   _disabled = true;
         std::deque<undo_state> _stack;
         object_database&       _db;
   };

} } // mart::db
