#pragma once

#include <bead/ledger/ledger_provider.hpp>
#include <bead/protocol/protocol_config.hpp>

namespace bead { namespace ledger {

   /**
    *  @class emulated_ledger
    *  @brief In-memory ledger with a settable clock, used to drive the core in tests.
    *
    *  Submitted transactions are checked against every rule that can be checked without
    *  scripts (existing unspent inputs, conservation of every unit, output minimums, the
    *  validity window and the fee) and applied to the output set.
    */
   class emulated_ledger : public ledger_provider
   {
      public:
         emulated_ledger( const protocol_config& config, const time_point_sec& start_time );

         virtual result<vector<spendable_output>>   get_spendable_outputs( const address_type& address ) override;
         virtual result<optional<oracle_record>>    get_oracle_record( game_id_type game_id,
                                                                       const policy_id_type& oracle_policy ) override;
         virtual result<transaction_id_type>        submit_transaction( const transaction_description& trx ) override;
         virtual result<time_point_sec>             now() override;

         void set_time( const time_point_sec& t ) { _now = t; }
         void advance( uint32_t seconds );

         /** Creates an output out of thin air, for seeding wallets and pots */
         output_reference fund( const address_type& address, share_type lovelace,
                                const asset_map& tokens = asset_map() );
         output_reference add_output( const transaction_output& output );

         /** Makes every following submission or query fail until reset */
         void reject_submissions( bool reject ) { _reject_submissions = reject; }
         void reject_queries( bool reject )     { _reject_queries = reject; }

         share_type balance( const address_type& address, const asset_unit_type& unit )const;
         share_type balance( const address_type& address )const { return balance( address, native_unit() ); }

         const vector<transaction_description>&  submitted()const { return _submitted; }
         uint32_t                                output_queries()const { return _output_queries; }
         uint32_t                                oracle_queries()const { return _oracle_queries; }

      private:
         void check_transaction( const transaction_description& trx )const;
         void apply_transaction( const transaction_id_type& id, const transaction_description& trx );
         output_reference insert( const transaction_id_type& id, uint32_t index, const transaction_output& output );

         protocol_config                                  _config;
         time_point_sec                                   _now;
         map<output_reference, spendable_output>          _unspent;
         vector<transaction_description>                  _submitted;
         uint32_t                                         _next_funding;
         uint32_t                                         _output_queries;
         uint32_t                                         _oracle_queries;
         bool                                             _reject_submissions;
         bool                                             _reject_queries;
   };

} } // bead::ledger
