#pragma once

#include <bead/ledger/emulated_ledger.hpp>
#include <bead/protocol/config.hpp>
#include <bead/protocol/protocol_config.hpp>
#include <bead/wallet/transaction_orchestrator.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <fc/io/json.hpp>

#include <boost/test/unit_test.hpp>

#include <cmath>

using namespace bead::protocol;
using namespace bead::wallet;
using namespace bead::ledger;

inline share_type ada( double amount )
{
   return share_type( std::llround( amount * BEAD_LOVELACE_PER_ADA ) );
}

#define BEAD_REQUIRE_SUCCESS( r ) \
   BOOST_REQUIRE_MESSAGE( (r).is_success(), (r).is_failure() ? (r).error().to_string() : std::string() )

#define BEAD_REQUIRE_FAILURE( r, c ) \
   BOOST_REQUIRE( (r).is_failure() ); \
   BOOST_REQUIRE_MESSAGE( (r).error().code == (c), (r).error().to_string() )

inline protocol_config test_config()
{
   auto cfg = protocol_config::defaults();
   cfg.bead_policy_id   = "beadpolicy";
   cfg.treasury_address = "addr_treasury";
   cfg.validate();
   return cfg;
}

inline spendable_output make_output( const std::string& trx, uint32_t index, share_type lovelace,
                                     const address_type& owner = "addr_alice" )
{
   spendable_output o;
   o.id      = output_reference( trx, index );
   o.address = owner;
   o.assets[native_unit()] = lovelace;
   return o;
}

/**
 *  An emulated ledger with funded wallets and one upcoming game.  The clock starts a day
 *  before kick off.
 */
struct ledger_fixture
{
   ledger_fixture()
   :config( test_config() ),
    start_time( fc::time_point::from_iso_string( "20250101T000000" ) ),
    ledger( config, start_time )
   {
      game.id         = 42;
      game.name       = "ARGBRA";
      game.start_time = start_time + 86400;

      contracts.bet_policy_id    = "betpolicy";
      contracts.oracle_policy_id = "oraclepolicy";
      contracts.pot_address      = "addr_pot";

      ledger.fund( "addr_alice", ada( 300 ) );
      ledger.fund( "addr_alice", ada( 200 ) );
      ledger.fund( "addr_bob", ada( 500 ) );
      ledger.fund( "addr_carol", ada( 2000 ) );
      ledger.fund( "addr_oracle", ada( 10 ) );
   }

   place_bet_request bet( const address_type& actor, game_outcome outcome, share_type stake, share_type bead_stake = 0 )const
   {
      place_bet_request r;
      r.actor      = actor;
      r.game       = game;
      r.outcome    = outcome;
      r.stake      = stake;
      r.bead_stake = bead_stake;
      r.contracts  = contracts;
      return r;
   }

   purchase_token_request purchase( const address_type& actor, share_type contribution,
                                    const optional<address_type>& referrer = optional<address_type>() )const
   {
      purchase_token_request r;
      r.actor        = actor;
      r.contribution = contribution;
      r.referrer     = referrer;
      return r;
   }

   redeem_bet_request redeem( const address_type& actor, game_outcome outcome, bool close_oracle = false )const
   {
      redeem_bet_request r;
      r.actor        = actor;
      r.game         = game;
      r.outcome      = outcome;
      r.contracts    = contracts;
      r.close_oracle = close_oracle;
      return r;
   }

   publish_game_result_request publish( game_outcome winner, const std::string& label )const
   {
      publish_game_result_request r;
      r.actor        = "addr_oracle";
      r.game         = game;
      r.winner       = winner;
      r.result_label = label;
      r.contracts    = contracts;
      return r;
   }

   collect_treasury_request collect()const
   {
      collect_treasury_request r;
      r.actor     = config.treasury_address;
      r.game      = game;
      r.contracts = contracts;
      return r;
   }

   /** Moves the clock past kick off */
   void play_game()
   {
      ledger.set_time( game.start_time + 7200 );
   }

   asset_unit_type bet_unit( game_outcome outcome )const
   {
      return bet_token_unit( contracts.bet_policy_id, outcome, game.name );
   }

   protocol_config    config;
   time_point_sec     start_time;
   emulated_ledger    ledger;
   game_reference     game;
   contract_references contracts;
};
