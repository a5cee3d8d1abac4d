#pragma once
#include <mart/chain/types.hpp>
#include <mart/chain/exceptions.hpp>

namespace mart { namespace chain {

   /**
    *  Outcome of a call into an asset registry.  When @ref succeeded is set the asset has been transferred
    *  and @ref payload holds the registry's payout description, which still has to be parsed and checked.
    */
   struct registry_call_result
   {
      bool     succeeded = false;
      string   payload;
      /** why the call failed */
      string   error;
   };

   /**
    *  @class asset_registry
    *  @brief the contract that owns custody of traded assets
    *
    *  The market never moves an asset itself.  It asks the registry to transfer the asset using the approval
    *  the owner granted, and reacts to the answer.  Implementations may throw fc::exception to report a failed
    *  transfer.
    */
   class asset_registry
   {
      public:
         virtual ~asset_registry(){}

         virtual registry_call_result transfer_payout( const account_name_type& receiver,
                                                       const asset_id_type& asset_id,
                                                       uint64_t approval_id,
                                                       share_type balance,
                                                       uint32_t max_len_payout ) = 0;
   };

   /**
    *  @class local_asset_registry
    *  @brief an asset registry kept in memory, with per token royalties
    *
    *  Every approval invalidates the previous one for the same token, and a transfer consumes the approval it used.
    */
   class local_asset_registry : public asset_registry
   {
      public:
         /** royalty recipient -> basis points of the sale price */
         typedef flat_map<account_name_type, uint16_t> royalty_table;

         explicit local_asset_registry( const account_name_type& name ):_name(name){}

         const account_name_type& name()const { return _name; }

         void              mint( const asset_id_type& asset_id, const account_name_type& owner, const royalty_table& royalties = royalty_table() );
         /** @return the approval id the market must present to transfer the token */
         uint64_t          approve( const asset_id_type& asset_id, const account_name_type& owner );
         bool              exists( const asset_id_type& asset_id )const { return _tokens.find( asset_id ) != _tokens.end(); }
         account_name_type owner_of( const asset_id_type& asset_id )const;
         bool              is_approved( const asset_id_type& asset_id, uint64_t approval_id )const;

         virtual registry_call_result transfer_payout( const account_name_type& receiver,
                                                       const asset_id_type& asset_id,
                                                       uint64_t approval_id,
                                                       share_type balance,
                                                       uint32_t max_len_payout ) override;

      private:
         struct token
         {
            account_name_type  owner;
            optional<uint64_t> approval_id;
            royalty_table      royalties;
         };

         const token& get_token( const asset_id_type& asset_id )const;

         account_name_type                _name;
         flat_map<asset_id_type, token>   _tokens;
         uint64_t                         _next_approval_id = 1;
   };

} } // mart::chain

FC_REFLECT( mart::chain::registry_call_result, (succeeded)(payload)(error) )
