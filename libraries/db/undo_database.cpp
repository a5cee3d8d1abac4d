#include <mart/db/object_database.hpp>
#include <mart/db/undo_database.hpp>

namespace mart { namespace db {

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session undo_database::start_undo_session()
{
   if( _disabled ) return session(*this, false);
   _stack.emplace_back();
   return session(*this, true);
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _stack.empty() ) return;
   auto& state = _stack.back();
   auto index_id = object_id_type( obj.id.space(), obj.id.type(), 0 );
   auto itr = state.old_index_next_ids.find( index_id );
   if( itr == state.old_index_next_ids.end() )
      state.old_index_next_ids[index_id] = obj.id;
   state.new_ids.insert(obj.id);
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _stack.empty() ) return;
   auto& state = _stack.back();
   if( state.new_ids.find(obj.id) != state.new_ids.end() )
      return;
   auto itr =  state.old_values.find(obj.id);
   if( itr != state.old_values.end() ) return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _stack.empty() ) return;
   auto& state = _stack.back();
   if( state.new_ids.find(obj.id) != state.new_ids.end() )
   {
      state.new_ids.erase(obj.id);
      return;
   }
   auto itr = state.old_values.find(obj.id);
   if( itr != state.old_values.end() )
   {
      state.removed[obj.id] = std::move(itr->second);
      state.old_values.erase(obj.id);
      return;
   }
   if( state.removed.find(obj.id) != state.removed.end() ) return;
   state.removed[obj.id] = obj.clone();
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled );
   FC_ASSERT( !_stack.empty() );
   disable();

   auto& state = _stack.back();
   for( auto& item : state.old_values )
      _db.modify( _db.get_object( item.second->id ), [&]( object& obj ){ obj.move_from( *item.second ); } );

   for( auto ritr = state.new_ids.rbegin(); ritr != state.new_ids.rend(); ++ritr  )
      _db.remove( _db.get_object(*ritr) );

   for( auto& item : state.old_index_next_ids )
      _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

   for( auto& item : state.removed )
      _db.insert( std::move(*item.second) );

   _stack.pop_back();
   enable();
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _stack.size() >= 2 );
   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];

   for( auto& obj : state.old_values )
   {
      if( prev_state.new_ids.find(obj.second->id) != prev_state.new_ids.end() )
         continue;
      if( prev_state.old_values.find(obj.second->id) == prev_state.old_values.end() )
         prev_state.old_values[obj.second->id] = std::move(obj.second);
   }
   for( auto id : state.new_ids )
      prev_state.new_ids.insert(id);
   for( auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }
   for( auto& obj : state.removed )
   {
      if( prev_state.new_ids.find(obj.second->id) != prev_state.new_ids.end() )
      {
         prev_state.new_ids.erase(obj.second->id);
         continue;
      }
      auto old = prev_state.old_values.find(obj.second->id);
      if( old != prev_state.old_values.end() )
      {
         prev_state.removed[obj.second->id] = std::move(old->second);
         prev_state.old_values.erase(old);
      }
      else if( prev_state.removed.find(obj.second->id) == prev_state.removed.end() )
         prev_state.removed[obj.second->id] = std::move(obj.second);
   }
   _stack.pop_back();
}

void undo_database::commit()
{
   FC_ASSERT( !_stack.empty() );
   _stack.pop_back();
}

} } // mart::db
