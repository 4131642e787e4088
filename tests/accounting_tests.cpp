#include "bead_fixture.hpp"

#include <bead/protocol/exceptions.hpp>
#include <bead/wallet/token_accounting.hpp>
#include <bead/wallet/transaction_builder.hpp>

namespace {

   oracle_record settled_record( game_outcome winner, share_type pool, share_type winnings )
   {
      oracle_record r;
      r.game_id         = 42;
      r.game_name       = "ARGBRA";
      r.settled_outcome = winner;
      r.bet_policy_id   = "betpolicy";
      r.total_pool      = pool;
      r.total_winnings  = winnings;
      r.result_label    = "2-1";
      return r;
   }

   spendable_output pot_bet( uint32_t index, game_outcome outcome, share_type lovelace, share_type tokens )
   {
      auto o = make_output( "pot", index, lovelace, "addr_pot" );
      bet_datum d;
      d.game_id    = 42;
      d.outcome    = outcome;
      d.bet_tokens = tokens;
      o.bet = d;
      return o;
   }

}

BOOST_FIXTURE_TEST_SUITE( accounting_tests, ledger_fixture )

BOOST_AUTO_TEST_CASE( bet_mints_stake_and_scaled_bead )
{
   try {
      auto acct = account_place_bet( bet( "addr_alice", home_outcome, ada( 100 ), 5 ), config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->bet_unit, "betpolicy.1ARGBRA" );
      BOOST_CHECK_EQUAL( acct->bet_tokens, ada( 100 ) + 5 * BEAD_SCALE_FACTOR );
      BOOST_CHECK_EQUAL( acct->pot_value, ada( 100 ) );
      BOOST_REQUIRE_EQUAL( acct->deltas.size(), 2u );
      BOOST_CHECK_EQUAL( acct->deltas[1].unit, config.bead_unit() );
      BOOST_CHECK_EQUAL( acct->deltas[1].quantity, -5 );

      auto ada_only = account_place_bet( bet( "addr_alice", tie_outcome, ada( 20 ) ), config );
      BEAD_REQUIRE_SUCCESS( ada_only );
      BOOST_CHECK_EQUAL( ada_only->bet_unit, "betpolicy.0ARGBRA" );
      BOOST_CHECK_EQUAL( ada_only->deltas.size(), 1u );
      BOOST_CHECK_EQUAL( ada_only->bead_burned, 0 );

      auto bead_only = account_place_bet( bet( "addr_alice", away_outcome, 0, 10 ), config );
      BEAD_REQUIRE_SUCCESS( bead_only );
      BOOST_CHECK_EQUAL( bead_only->pot_value, config.selection.min_output_value );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_with_referral )
{
   try {
      auto acct = account_purchase( purchase( "addr_carol", ada( 1000 ), address_type( "addr_dave" ) ), config );
      BEAD_REQUIRE_SUCCESS( acct );

      BOOST_CHECK_EQUAL( acct->tier.threshold, ada( 1000 ) );
      BOOST_CHECK_EQUAL( acct->bead_minted, 5250 );
      BOOST_CHECK_EQUAL( acct->referral_minted, 25 );
      BOOST_REQUIRE( acct->distribution.valid() );
      BOOST_REQUIRE( acct->referral_bonus_bps.valid() );
      BOOST_CHECK_EQUAL( *acct->referral_bonus_bps, 500u );
      BOOST_CHECK_EQUAL( acct->distribution->referral, ada( 50 ) );
      BOOST_CHECK_EQUAL( acct->distribution->treasury, ada( 950 ) );
      BOOST_CHECK_EQUAL( acct->distribution->treasury + acct->distribution->referral, acct->contribution );
      BOOST_CHECK_EQUAL( acct->deltas.size(), 2u );
      BOOST_CHECK( acct->warnings.empty() );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_without_referral )
{
   try {
      auto acct = account_purchase( purchase( "addr_carol", ada( 1000 ) ), config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->bead_minted, 5250 );
      BOOST_CHECK( !acct->distribution.valid() );
      BOOST_CHECK( !acct->referral_bonus_bps.valid() );
      BOOST_CHECK_EQUAL( acct->referral_minted, 0 );
      BOOST_CHECK_EQUAL( acct->deltas.size(), 1u );
      BOOST_CHECK_EQUAL( purchase_outlay( purchase( "addr_carol", ada( 1000 ) ), config ), ada( 1000 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( purchase_between_tiers_is_proportional )
{
   try {
      auto acct = account_purchase( purchase( "addr_carol", ada( 300 ) ), config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->tier.threshold, ada( 200 ) );
      BOOST_CHECK_EQUAL( acct->bead_minted, 1500 );

      BEAD_REQUIRE_FAILURE( account_purchase( purchase( "addr_carol", ada( 100 ) ), config ), invalid_input );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( small_referral_share_is_topped_up )
{
   try {
      auto cfg = config;
      cfg.selection.min_output_value = ada( 20 );
      auto request = purchase( "addr_carol", ada( 200 ), address_type( "addr_dave" ) );

      auto acct = account_purchase( request, cfg );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->distribution->referral, ada( 10 ) );
      BOOST_CHECK_EQUAL( acct->referrer_output_value, ada( 20 ) );
      BOOST_REQUIRE_EQUAL( acct->warnings.size(), 1u );
      BOOST_CHECK_EQUAL( acct->warnings.front(), "referral bonus below recommended minimum" );
      BOOST_CHECK_EQUAL( purchase_outlay( request, cfg ), ada( 210 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( winner_takes_a_share_of_the_pool )
{
   try {
      auto acct = account_redemption( bet_unit( home_outcome ), ada( 50 ),
                                      settled_record( home_outcome, ada( 300 ), ada( 100 ) ), true, config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->payout, ada( 150 ) );
      BOOST_CHECK_CLOSE( acct->multiplier, 3.0, 0.0001 );
      BOOST_CHECK( !acct->refunded );
      BOOST_REQUIRE_EQUAL( acct->deltas.size(), 1u );
      BOOST_CHECK_EQUAL( acct->deltas.front().quantity, -ada( 50 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( loser_burns_without_payout )
{
   try {
      auto acct = account_redemption( bet_unit( away_outcome ), ada( 50 ),
                                      settled_record( home_outcome, ada( 300 ), ada( 100 ) ), false, config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->payout, 0 );
      BOOST_CHECK_EQUAL( acct->multiplier, 0.0 );
      BOOST_CHECK_EQUAL( acct->deltas.front().unit, bet_unit( away_outcome ) );
      BOOST_CHECK_EQUAL( acct->deltas.front().quantity, -ada( 50 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( nobody_won_refunds_at_par )
{
   try {
      auto acct = account_redemption( bet_unit( away_outcome ), ada( 40 ),
                                      settled_record( home_outcome, ada( 100 ), 0 ), false, config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK( acct->refunded );
      BOOST_CHECK_EQUAL( acct->payout, ada( 40 ) );
      BOOST_CHECK_CLOSE( acct->multiplier, 1.0, 0.0001 );
      BOOST_CHECK_EQUAL( acct->warnings.size(), 1u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( redemption_limits )
{
   try {
      BEAD_REQUIRE_FAILURE( account_redemption( bet_unit( home_outcome ), ada( 200 ),
                                                settled_record( home_outcome, ada( 300 ), ada( 100 ) ), true, config ),
                            accounting_error );

      auto cfg = config;
      cfg.max_payout = ada( 100 );
      BEAD_REQUIRE_FAILURE( account_redemption( bet_unit( home_outcome ), ada( 50 ),
                                                settled_record( home_outcome, ada( 300 ), ada( 100 ) ), true, cfg ),
                            invalid_input );

      auto tiny = account_redemption( bet_unit( home_outcome ), 1000,
                                      settled_record( home_outcome, ada( 300 ), ada( 100 ) ), true, config );
      BEAD_REQUIRE_SUCCESS( tiny );
      BOOST_CHECK_EQUAL( tiny->payout, 3000 );
      BOOST_CHECK_EQUAL( tiny->warnings.size(), 1u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( game_result_tallies_the_pot )
{
   try {
      vector<spendable_output> pot{ pot_bet( 0, home_outcome, ada( 100 ), ada( 100 ) ),
                                    pot_bet( 1, away_outcome, ada( 50 ), ada( 50 ) ),
                                    pot_bet( 2, home_outcome, ada( 1 ), 10 * BEAD_SCALE_FACTOR ) };
      auto other_game = pot_bet( 3, home_outcome, ada( 70 ), ada( 70 ) );
      other_game.bet->game_id = 7;
      pot.push_back( other_game );

      auto acct = account_game_result( publish( home_outcome, "2-1" ), pot, start_time, config );
      BEAD_REQUIRE_SUCCESS( acct );

      BOOST_CHECK_EQUAL( acct->record.total_pool, ada( 151 ) );
      BOOST_CHECK_EQUAL( acct->record.total_winnings, ada( 100 ) + 10 * BEAD_SCALE_FACTOR );
      BOOST_CHECK( *acct->record.settled_outcome == home_outcome );
      BOOST_CHECK_EQUAL( acct->tally.at( home_outcome ).bets, 2u );
      BOOST_CHECK_EQUAL( acct->tally.at( tie_outcome ).bets, 0u );
      BOOST_CHECK_EQUAL( acct->oracle_unit, "oraclepolicy.2-1" );
      BOOST_CHECK_EQUAL( acct->treasury_fee, mul_div( ada( 151 ), 200, 10000 ) );
      BOOST_REQUIRE_EQUAL( acct->deltas.size(), 1u );
      BOOST_CHECK_EQUAL( acct->deltas.front().quantity, 1 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_sweeps_one_settled_game )
{
   try {
      oracle_record record;
      record.game_id         = game.id;
      record.game_name       = game.name;
      record.bet_policy_id   = contracts.bet_policy_id;
      record.settled_outcome = home_outcome;
      record.result_label    = "2-1";

      auto oracle_output = make_output( "pot", 0, ada( 2 ), "addr_pot" );
      oracle_output.assets["oraclepolicy.2-1"] = 1;
      oracle_output.oracle = record;

      auto unredeemed = make_output( "pot", 1, ada( 5 ), "addr_pot" );
      unredeemed.bet = bet_datum();
      unredeemed.bet->game_id    = game.id;
      unredeemed.bet->bet_tokens = ada( 5 );

      auto other_game = make_output( "pot", 2, ada( 50 ), "addr_pot" );
      other_game.bet = bet_datum();
      other_game.bet->game_id = game.id + 1;

      auto plain = make_output( "pot", 3, ada( 20 ), "addr_pot" );

      auto acct = account_collection( collect(), { other_game, oracle_output, plain, unredeemed }, config );
      BEAD_REQUIRE_SUCCESS( acct );
      BOOST_CHECK_EQUAL( acct->swept.size(), 2u );
      BOOST_CHECK_EQUAL( acct->collected, ada( 7 ) - config.network_fee );
      BOOST_REQUIRE_EQUAL( acct->deltas.size(), 1u );
      BOOST_CHECK_EQUAL( acct->deltas.front().quantity, -1 );
      BOOST_CHECK_EQUAL( acct->warnings.size(), 1u );

      // an oracle output alone that cannot pay for the fee and a treasury output
      auto small = oracle_output;
      small.assets[native_unit()] = ada( 1 );
      BEAD_REQUIRE_FAILURE( account_collection( collect(), { small }, config ), insufficient_funds );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( collection_waits_for_a_settled_result )
{
   try {
      auto stake = make_output( "pot", 0, ada( 100 ), "addr_pot" );
      stake.bet = bet_datum();
      stake.bet->game_id = game.id;

      BEAD_REQUIRE_FAILURE( account_collection( collect(), vector<spendable_output>(), config ), game_not_found );
      BEAD_REQUIRE_FAILURE( account_collection( collect(), { stake }, config ), game_not_found );

      oracle_record pending;
      pending.game_id = game.id;
      auto pending_output = make_output( "pot", 1, ada( 2 ), "addr_pot" );
      pending_output.assets["oraclepolicy.pending"] = 1;
      pending_output.oracle = pending;
      BEAD_REQUIRE_FAILURE( account_collection( collect(), { stake, pending_output }, config ), oracle_not_settled );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( builder_balances_every_unit )
{
   try {
      const asset_unit_type token = "betpolicy.1ARGBRA";
      transaction_builder builder( config );
      builder.spend( make_output( "w", 0, ada( 10 ) ) )
             .mint( "addr_alice", token, 500 )
             .pay( "addr_alice", transaction_output( "addr_pot", normalized( { { native_unit(), ada( 4 ) } } ) ) )
             .pay_fee( "addr_alice", config.network_fee );

      const auto& trx = builder.finalize();
      BOOST_REQUIRE_EQUAL( trx.outputs.size(), 2u );
      const auto& change = trx.outputs.back();
      BOOST_CHECK_EQUAL( change.address, "addr_alice" );
      BOOST_CHECK_EQUAL( change.native(), ada( 6 ) - config.network_fee );
      BOOST_CHECK_EQUAL( quantity_of( change.assets, token ), 500 );
      BOOST_REQUIRE_EQUAL( trx.mint.size(), 1u );
      BOOST_CHECK_EQUAL( trx.mint.front().quantity, 500 );
      builder.verify_balanced();
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( builder_rejects_overdrafts )
{
   try {
      transaction_builder short_builder( config );
      short_builder.spend( make_output( "w", 0, ada( 3 ) ) )
                   .pay( "addr_alice", transaction_output( "addr_pot", normalized( { { native_unit(), ada( 5 ) } } ) ) );
      BOOST_CHECK_THROW( short_builder.finalize(), unbalanced_transaction );

      transaction_builder burn_builder( config );
      burn_builder.spend( make_output( "w", 0, ada( 3 ) ) );
      BOOST_CHECK_THROW( burn_builder.burn( "addr_alice", "beadpolicy.BEAD PR", 1 ), burn_exceeds_holdings );

      transaction_builder dust_builder( config );
      dust_builder.spend( make_output( "w", 0, ada( 3 ) ) )
                  .pay( "addr_alice", transaction_output( "addr_pot", normalized( { { native_unit(), ada( 2.5 ) } } ) ) );
      BOOST_CHECK_THROW( dust_builder.finalize(), output_below_minimum );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( builder_keeps_accounts_apart )
{
   try {
      transaction_builder builder( config );
      builder.spend( make_output( "w", 0, ada( 10 ) ) )
             .spend( make_output( "p", 0, ada( 20 ), "addr_pot" ) )
             .transfer( "addr_pot", "addr_alice", asset( ada( 5 ) ) )
             .pay_fee( "addr_alice", config.network_fee );
      const auto& trx = builder.finalize();

      BOOST_REQUIRE_EQUAL( trx.outputs.size(), 2u );
      for( const auto& o : trx.outputs )
      {
         if( o.address == "addr_alice" )
            BOOST_CHECK_EQUAL( o.native(), ada( 15 ) - config.network_fee );
         else
            BOOST_CHECK_EQUAL( o.native(), ada( 15 ) );
      }
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
