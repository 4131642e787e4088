#pragma once

#include <bead/protocol/outputs.hpp>
#include <bead/protocol/protocol_config.hpp>

namespace bead { namespace wallet {

   using namespace bead::protocol;

   /**
    * @brief The transaction_builder assembles a transaction_description for one or more accounts.
    *
    * Every input credits the account (address) owning it and every output, burn or fee charges the
    * account paying for it.  Different accounts' credits and debits are not mixed: when the builder
    * finalizes, each account with a positive outstanding balance receives a change output carrying
    * exactly that balance, and an account left with a negative balance makes the transaction unbalanced.
    *
    * The builder never looks at the ledger; callers hand it the outputs they selected.
    */
   class transaction_builder
   {
      public:
         explicit transaction_builder( const protocol_config& config );

         /**
          * \defgroup<charge_functions> Low-Level Balance Manipulation Functions
          *
          * Calling these functions naively may result in a broken transaction, i.e. if credit_balance is
          * called without an opposing call to deduct_balance, finalize() will refuse the transaction.
          */
         /// @{
         void deduct_balance( const address_type& account_to_charge, const asset& amount )
         {
            FC_ASSERT( amount.amount >= 0, "Don't deduct a negative amount. Call credit_balance instead.",
                       ("amount", amount) );
            auto& balance = outstanding_balances[std::make_pair( account_to_charge, amount.unit )];
            balance = checked_sub( balance, amount.amount );
         }
         void credit_balance( const address_type& account_to_credit, const asset& amount )
         {
            FC_ASSERT( amount.amount >= 0, "Don't credit a negative amount. Call deduct_balance instead.",
                       ("amount", amount) );
            auto& balance = outstanding_balances[std::make_pair( account_to_credit, amount.unit )];
            balance = checked_add( balance, amount.amount );
         }
         /// @}

         /**
          * \defgroup<builders> Builder Functions
          * Each returns a reference to the builder so calls can be chained:
          * @code
          * builder.spend( inputs )
          *        .mint( actor, bet_unit, tokens )
          *        .pay( actor, pot_output )
          *        .pay_fee( actor, fee );
          * @endcode
          */
         /// @{
         transaction_builder& spend( const spendable_output& input );
         transaction_builder& spend( const vector<spendable_output>& inputs );

         /** Adds an output charged to payer; the output must carry at least the minimum output value */
         transaction_builder& pay( const address_type& payer, const transaction_output& output );

         /** Moves value between two accounts without creating an output */
         transaction_builder& transfer( const address_type& from, const address_type& to, const asset& amount );

         /** Mints quantity of unit into the balance of account */
         transaction_builder& mint( const address_type& account, const asset_unit_type& unit, share_type quantity );

         /** Burns quantity of unit from the balance of holder; never more than the inputs provide */
         transaction_builder& burn( const address_type& holder, const asset_unit_type& unit, share_type quantity );

         transaction_builder& pay_fee( const address_type& payer, share_type fee );
         transaction_builder& set_validity( const validity_interval& validity );
         transaction_builder& require_signature( const address_type& signer );
         transaction_builder& set_memo( const string& memo );
         /// @}

         /**
          * Turns every positive outstanding balance into a change output for its account and checks that
          * the description conserves every unit.  Throws unbalanced_transaction or output_below_minimum.
          */
         const transaction_description& finalize();

         /** inputs + mints == outputs + burns + fee, unit by unit */
         void verify_balanced()const;

         /** Net mint (positive) or burn (negative) per unit, zero entries dropped */
         vector<token_delta> token_deltas()const;

         const transaction_description& description()const { return _trx; }

         ///Map of <owning account address, unit> to that account's balance in that unit
         map<pair<address_type, asset_unit_type>, share_type> outstanding_balances;

      private:
         share_type                  _min_output_value;
         transaction_description     _trx;
         asset_map                   _input_totals;
         asset_map                   _minted;
         asset_map                   _burned;
         set<output_reference>       _spent;
         bool                        _finalized;
   };

} } // bead::wallet
