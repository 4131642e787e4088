#include <bead/ledger/emulated_ledger.hpp>
#include <bead/protocol/exceptions.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

namespace bead { namespace ledger {

   emulated_ledger::emulated_ledger( const protocol_config& config, const time_point_sec& start_time )
   :_config(config),
    _now(start_time),
    _next_funding(0),
    _output_queries(0),
    _oracle_queries(0),
    _reject_submissions(false),
    _reject_queries(false)
   {
   }

   void emulated_ledger::advance( uint32_t seconds )
   {
      _now = _now + seconds;
   }

   result<time_point_sec> emulated_ledger::now()
   {
      if( _reject_queries )
         return failure( network_error, "Ledger did not answer the time query" );
      return _now;
   }

   output_reference emulated_ledger::fund( const address_type& address, share_type lovelace, const asset_map& tokens )
   {
      asset_map assets( tokens );
      assets[native_unit()] = lovelace;
      return add_output( transaction_output( address, normalized( assets ) ) );
   }

   output_reference emulated_ledger::add_output( const transaction_output& output )
   { try {
      FC_ASSERT( !output.address.empty() );
      FC_ASSERT( output.native() >= 0 );
      auto id = fc::sha256::hash( "funding" + fc::to_string( uint64_t( _next_funding++ ) ) ).str();
      return insert( id, 0, output );
   } FC_CAPTURE_AND_RETHROW( (output) ) }

   output_reference emulated_ledger::insert( const transaction_id_type& id, uint32_t index, const transaction_output& output )
   {
      spendable_output utxo;
      utxo.id      = output_reference( id, index );
      utxo.address = output.address;
      utxo.assets  = normalized( output.assets );
      utxo.bet     = output.bet;
      utxo.oracle  = output.oracle;
      _unspent[utxo.id] = utxo;
      return utxo.id;
   }

   result<vector<spendable_output>> emulated_ledger::get_spendable_outputs( const address_type& address )
   {
      ++_output_queries;
      if( _reject_queries )
         return failure( network_error, "Ledger did not answer the output query",
                         mutable_variant_object( "address", address ) );

      vector<spendable_output> outputs;
      for( const auto& item : _unspent )
         if( item.second.address == address )
            outputs.push_back( item.second );
      return outputs;
   }

   result<optional<oracle_record>> emulated_ledger::get_oracle_record( game_id_type game_id,
                                                                       const policy_id_type& oracle_policy )
   {
      ++_oracle_queries;
      if( _reject_queries )
         return failure( network_error, "Ledger did not answer the oracle query",
                         mutable_variant_object( "game_id", game_id )( "oracle_policy", oracle_policy ) );

      optional<oracle_record> found;
      for( const auto& item : _unspent )
      {
         const auto& utxo = item.second;
         if( !utxo.oracle.valid() || utxo.oracle->game_id != game_id )
            continue;

         bool carries_policy_token = false;
         for( const auto& a : utxo.assets )
            if( a.second > 0 && unit_policy( a.first ) == oracle_policy )
               carries_policy_token = true;
         if( !carries_policy_token )
            continue;

         if( !found.valid() || found->published < utxo.oracle->published )
            found = *utxo.oracle;
      }
      return found;
   }

   share_type emulated_ledger::balance( const address_type& address, const asset_unit_type& unit )const
   {
      share_type total = 0;
      for( const auto& item : _unspent )
         if( item.second.address == address )
            total = checked_add( total, item.second.quantity( unit ) );
      return total;
   }

   void emulated_ledger::check_transaction( const transaction_description& trx )const
   { try {
      FC_ASSERT( !trx.inputs.empty(), "transaction spends nothing" );

      if( !trx.validity.contains( _now ) )
      {
         if( trx.validity.valid_from.valid() && _now < *trx.validity.valid_from )
            FC_THROW_EXCEPTION( transaction_not_yet_valid, "transaction is valid from ${f}, ledger time is ${n}",
                                ("f", *trx.validity.valid_from)("n", _now) );
         FC_THROW_EXCEPTION( expired_transaction, "transaction expired at ${t}, ledger time is ${n}",
                             ("t", trx.validity.valid_to)("n", _now) );
      }

      if( trx.fee < _config.network_fee )
         FC_THROW_EXCEPTION( insufficient_fee, "fee ${f} is below the minimum ${m}", ("f", trx.fee)("m", _config.network_fee) );

      asset_map residual;
      set<output_reference> seen;
      for( const auto& in : trx.inputs )
      {
         if( !seen.insert( in ).second )
            FC_THROW_EXCEPTION( duplicate_input, "${i} is spent twice", ("i", in) );
         auto itr = _unspent.find( in );
         if( itr == _unspent.end() )
            FC_THROW_EXCEPTION( unknown_output, "${i} is not an unspent output", ("i", in) );
         add_to( residual, itr->second.assets );
      }

      for( const auto& delta : trx.mint )
      {
         if( delta.unit == native_unit() || delta.quantity == 0 )
            FC_THROW_EXCEPTION( invalid_asset_unit, "invalid mint entry ${d}", ("d", delta) );
         add_to( residual, asset( delta.quantity, delta.unit ) );
      }

      for( const auto& out : trx.outputs )
      {
         if( out.native() < _config.selection.min_output_value )
            FC_THROW_EXCEPTION( output_below_minimum, "output to ${a} carries ${v} lovelace",
                                ("a", out.address)("v", out.native()) );
         for( const auto& a : out.assets )
         {
            if( a.second < 0 )
               FC_THROW_EXCEPTION( negative_quantity, "output to ${a} holds a negative quantity", ("a", out.address) );
            residual[a.first] = checked_sub( residual[a.first], a.second );
         }
      }
      residual[native_unit()] = checked_sub( residual[native_unit()], trx.fee );

      for( const auto& item : residual )
         if( item.second != 0 )
            FC_THROW_EXCEPTION( unbalanced_transaction, "${u} does not balance, residual ${r}",
                                ("u", item.first)("r", item.second) );
   } FC_CAPTURE_AND_RETHROW( (trx) ) }

   void emulated_ledger::apply_transaction( const transaction_id_type& id, const transaction_description& trx )
   {
      for( const auto& in : trx.inputs )
         _unspent.erase( in );
      for( uint32_t i = 0; i < trx.outputs.size(); ++i )
         insert( id, i, trx.outputs[i] );
      _submitted.push_back( trx );
   }

   result<transaction_id_type> emulated_ledger::submit_transaction( const transaction_description& trx )
   {
      try {
         if( _reject_submissions )
            FC_THROW_EXCEPTION( submission_rejected, "ledger refuses submissions" );

         check_transaction( trx );

         transaction_id_type id = fc::sha256::hash( fc::json::to_string( trx ) ).str();
         apply_transaction( id, trx );

         ilog( "applied transaction ${id} with ${i} inputs and ${o} outputs",
               ("id", id)("i", trx.inputs.size())("o", trx.outputs.size()) );
         return id;
      }
      catch( const fc::exception& e )
      {
         wlog( "rejected transaction: ${e}", ("e", e.to_detail_string()) );
         return failure_from_exception( transaction_failed, "Ledger rejected the transaction", e );
      }
   }

} } // bead::ledger
