#include <bead/wallet/transaction_builder.hpp>

#include <bead/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

using namespace bead::wallet;

transaction_builder::transaction_builder( const protocol_config& config )
:_min_output_value( config.selection.min_output_value ),_finalized( false )
{
   _trx.fee = 0;
}

transaction_builder& transaction_builder::spend( const spendable_output& input )
{ try {
   FC_ASSERT( !_finalized, "transaction already finalized" );
   if( _spent.count( input.id ) )
      FC_THROW_EXCEPTION( duplicate_input, "output ${o} is spent twice", ("o", input.id) );

   _spent.insert( input.id );
   _trx.inputs.push_back( input.id );
   for( const auto& item : input.assets )
   {
      if( item.second < 0 )
         FC_THROW_EXCEPTION( negative_quantity, "input ${o} holds a negative quantity", ("o", input.id)("unit", item.first) );
      credit_balance( input.address, asset( item.second, item.first ) );
      _input_totals[item.first] = checked_add( _input_totals[item.first], item.second );
   }
   return *this;
} FC_CAPTURE_AND_RETHROW( (input) ) }

transaction_builder& transaction_builder::spend( const vector<spendable_output>& inputs )
{
   for( const auto& input : inputs )
      spend( input );
   return *this;
}

transaction_builder& transaction_builder::pay( const address_type& payer, const transaction_output& output )
{ try {
   FC_ASSERT( !_finalized, "transaction already finalized" );
   FC_ASSERT( !output.address.empty(), "output needs an address" );
   if( output.native() < _min_output_value )
      FC_THROW_EXCEPTION( output_below_minimum, "output to ${a} carries ${v} lovelace, minimum is ${m}",
                          ("a", output.address)("v", output.native())("m", _min_output_value) );

   for( const auto& item : output.assets )
      deduct_balance( payer, asset( item.second, item.first ) );
   _trx.outputs.push_back( output );
   return *this;
} FC_CAPTURE_AND_RETHROW( (payer)(output) ) }

transaction_builder& transaction_builder::transfer( const address_type& from, const address_type& to, const asset& amount )
{ try {
   deduct_balance( from, amount );
   credit_balance( to, amount );
   return *this;
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

transaction_builder& transaction_builder::mint( const address_type& account, const asset_unit_type& unit, share_type quantity )
{ try {
   FC_ASSERT( quantity > 0, "mint quantity must be positive" );
   FC_ASSERT( unit != native_unit(), "the native unit cannot be minted" );
   credit_balance( account, asset( quantity, unit ) );
   _minted[unit] = checked_add( _minted[unit], quantity );
   return *this;
} FC_CAPTURE_AND_RETHROW( (account)(unit)(quantity) ) }

transaction_builder& transaction_builder::burn( const address_type& holder, const asset_unit_type& unit, share_type quantity )
{ try {
   FC_ASSERT( quantity > 0, "burn quantity must be positive" );
   FC_ASSERT( unit != native_unit(), "the native unit cannot be burned" );

   share_type burned = checked_add( quantity_of( _burned, unit ), quantity );
   if( burned > quantity_of( _input_totals, unit ) )
      FC_THROW_EXCEPTION( burn_exceeds_holdings, "burning ${b} ${u} but the inputs only hold ${h}",
                          ("b", burned)("u", unit)("h", quantity_of( _input_totals, unit )) );

   deduct_balance( holder, asset( quantity, unit ) );
   _burned[unit] = burned;
   return *this;
} FC_CAPTURE_AND_RETHROW( (holder)(unit)(quantity) ) }

transaction_builder& transaction_builder::pay_fee( const address_type& payer, share_type fee )
{ try {
   FC_ASSERT( fee >= 0 );
   deduct_balance( payer, asset( fee ) );
   _trx.fee = checked_add( _trx.fee, fee );
   return *this;
} FC_CAPTURE_AND_RETHROW( (payer)(fee) ) }

transaction_builder& transaction_builder::set_validity( const validity_interval& validity )
{
   _trx.validity = validity;
   return *this;
}

transaction_builder& transaction_builder::require_signature( const address_type& signer )
{
   _trx.required_signers.insert( signer );
   return *this;
}

transaction_builder& transaction_builder::set_memo( const string& memo )
{
   _trx.memo = memo;
   return *this;
}

const transaction_description& transaction_builder::finalize()
{ try {
   FC_ASSERT( !_finalized, "transaction already finalized" );
   FC_ASSERT( !_trx.inputs.empty(), "Cannot finalize a transaction without inputs" );

   map<address_type, asset_map> change;
   //outstanding_balance is pair<pair<account address, unit>, share_type>
   for( const auto& outstanding_balance : outstanding_balances )
   {
      const auto& account = outstanding_balance.first.first;
      asset balance( outstanding_balance.second, outstanding_balance.first.second );

      if( balance.amount < 0 )
         FC_THROW_EXCEPTION( unbalanced_transaction, "${account} is short ${amount} ${unit}",
                             ("account", account)("amount", -balance.amount)("unit", balance.unit) );
      if( balance.amount > 0 )
         add_to( change[account], balance );
   }

   for( const auto& item : change )
   {
      transaction_output output( item.first, normalized( item.second ) );
      if( output.native() < _min_output_value )
         FC_THROW_EXCEPTION( output_below_minimum, "change of ${v} lovelace to ${a} is below the minimum output value",
                             ("v", output.native())("a", item.first)("assets", item.second) );
      _trx.outputs.push_back( output );
      ilog( "change to ${a}: ${assets}", ("a", item.first)("assets", output.assets) );
   }
   outstanding_balances.clear();

   _trx.mint = token_deltas();
   verify_balanced();
   _finalized = true;
   return _trx;
} FC_CAPTURE_AND_RETHROW( (_trx) ) }

void transaction_builder::verify_balanced()const
{
   asset_map residual( _input_totals );
   for( const auto& delta : token_deltas() )
      add_to( residual, asset( delta.quantity, delta.unit ) );
   for( const auto& output : _trx.outputs )
      for( const auto& item : output.assets )
         residual[item.first] = checked_sub( residual[item.first], item.second );
   residual[native_unit()] = checked_sub( residual[native_unit()], _trx.fee );

   for( const auto& item : residual )
   {
      if( item.second != 0 )
         FC_THROW_EXCEPTION( unbalanced_transaction, "${unit} does not balance, residual ${r}",
                             ("unit", item.first)("r", item.second)("residuals", residual) );
   }
}

vector<token_delta> transaction_builder::token_deltas()const
{
   asset_map net( _minted );
   for( const auto& item : _burned )
      net[item.first] = checked_sub( net[item.first], item.second );

   vector<token_delta> deltas;
   for( const auto& item : net )
      if( item.second != 0 )
         deltas.push_back( token_delta( item.first, item.second ) );
   return deltas;
}
