#include "bead_fixture.hpp"

#include <bead/wallet/input_selector.hpp>

namespace {

   selection_policy small_policy()
   {
      selection_policy p;
      p.dust_threshold          = 10;
      p.min_output_value        = 10;
      p.max_inputs              = 50;
      p.optimal_candidate_limit = 16;
      p.optimal_max_inputs      = 2;
      p.optimal_slack_tolerance = 10;
      return p;
   }

   vector<spendable_output> wallet_of( const vector<share_type>& values )
   {
      vector<spendable_output> outputs;
      for( uint32_t i = 0; i < values.size(); ++i )
         outputs.push_back( make_output( "wallet", i, values[i] ) );
      return outputs;
   }

   selection_request needs( share_type target )
   {
      selection_request r;
      r.target = target;
      return r;
   }

}

BOOST_AUTO_TEST_SUITE( selector_tests )

BOOST_AUTO_TEST_CASE( optimal_selection_skips_dust )
{
   try {
      auto sel = select_inputs( wallet_of( { 100, 50, 30, 5 } ), needs( 120 ), small_policy() );
      BEAD_REQUIRE_SUCCESS( sel );

      BOOST_CHECK_EQUAL( sel->strategy, optimal_selection );
      BOOST_CHECK_EQUAL( sel->total_input, 130 );
      BOOST_CHECK_EQUAL( sel->change, 10 );
      BOOST_CHECK_EQUAL( sel->dust_skipped, 1u );
      BOOST_REQUIRE_EQUAL( sel->inputs.size(), 2u );
      BOOST_CHECK( sel->inputs[0] == output_reference( "wallet", 0 ) );
      BOOST_CHECK( sel->inputs[1] == output_reference( "wallet", 2 ) );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( greedy_when_no_small_combination_fits )
{
   try {
      auto sel = select_inputs( wallet_of( { 100, 50, 30, 5 } ), needs( 170 ), small_policy() );
      BEAD_REQUIRE_SUCCESS( sel );

      BOOST_CHECK_EQUAL( sel->strategy, greedy_selection );
      BOOST_CHECK_EQUAL( sel->inputs.size(), 3u );
      BOOST_CHECK_EQUAL( sel->total_input, 180 );
      BOOST_CHECK_EQUAL( sel->change, 10 );
      BOOST_CHECK_EQUAL( sel->dust_skipped, 1u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( insufficient_funds )
{
   try {
      auto sel = select_inputs( wallet_of( { 50, 25, 5 } ), needs( 120 ), small_policy() );
      BEAD_REQUIRE_FAILURE( sel, insufficient_funds );
      BOOST_CHECK_EQUAL( sel.error().context["available"].as_int64(), 80 );
      BOOST_CHECK_EQUAL( sel.error().context["shortfall"].as_int64(), 40 );
      BOOST_CHECK( !sel.error().suggestions.empty() );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( fee_reserve_is_covered )
{
   try {
      auto request = needs( 100 );
      request.fee_reserve = 30;
      auto sel = select_inputs( wallet_of( { 100, 50, 30 } ), request, small_policy() );
      BEAD_REQUIRE_SUCCESS( sel );
      BOOST_CHECK_EQUAL( sel->total_input, 130 );
      BOOST_CHECK_EQUAL( sel->change, 0 );
      BOOST_CHECK_EQUAL( sel->fee_reserve, 30 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( change_below_minimum_is_avoided )
{
   try {
      // 100 + 8 leaves change of 3, the walk continues with the next dust output
      auto sel = select_inputs( wallet_of( { 100, 8, 7 } ), needs( 105 ), small_policy() );
      BEAD_REQUIRE_SUCCESS( sel );
      BOOST_CHECK_EQUAL( sel->strategy, fallback_selection );
      BOOST_CHECK_EQUAL( sel->total_input, 115 );
      BOOST_CHECK_EQUAL( sel->change, 10 );
      BOOST_CHECK_EQUAL( sel->dust_skipped, 0u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( too_many_inputs )
{
   try {
      auto policy = small_policy();
      policy.max_inputs = 2;
      auto sel = select_inputs( wallet_of( { 40, 40, 40, 40 } ), needs( 150 ), policy );
      BEAD_REQUIRE_FAILURE( sel, too_many_inputs );
      BOOST_CHECK_EQUAL( sel.error().context["required_inputs"].as_uint64(), 4u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( required_change_rejects_exact_match )
{
   try {
      auto request = needs( 100 );
      request.change_required = true;
      auto sel = select_inputs( wallet_of( { 100 } ), request, small_policy() );
      BEAD_REQUIRE_FAILURE( sel, insufficient_funds );

      sel = select_inputs( wallet_of( { 100, 20 } ), request, small_policy() );
      BEAD_REQUIRE_SUCCESS( sel );
      BOOST_CHECK_EQUAL( sel->change, 20 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( preselected_outputs_are_always_spent )
{
   try {
      auto wallet = wallet_of( { 100, 50, 30 } );
      auto request = needs( 60 );
      request.preselected.push_back( wallet[2] );

      auto policy = small_policy();
      policy.optimal_slack_tolerance = 20;
      auto sel = select_inputs( wallet, request, policy );
      BEAD_REQUIRE_SUCCESS( sel );
      BOOST_CHECK_EQUAL( sel->strategy, optimal_selection );
      BOOST_CHECK( sel->inputs.front() == wallet[2].id );
      BOOST_CHECK_EQUAL( sel->total_input, 80 );
      BOOST_CHECK_EQUAL( sel->change, 20 );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( preselected_outputs_count_against_the_input_limit )
{
   try {
      auto policy = small_policy();
      policy.max_inputs = 2;

      // the required outputs alone already cover the amount
      auto wallet = wallet_of( { 100, 100, 100, 50 } );
      auto request = needs( 10 );
      request.change_required = true;
      request.preselected.assign( wallet.begin(), wallet.begin() + 3 );

      auto sel = select_inputs( wallet, request, policy );
      BEAD_REQUIRE_FAILURE( sel, too_many_inputs );
      BOOST_CHECK_EQUAL( sel.error().context["required_inputs"].as_uint64(), 3u );

      // two required outputs plus one picked output
      request = needs( 250 );
      request.preselected.assign( wallet.begin(), wallet.begin() + 2 );
      sel = select_inputs( wallet, request, policy );
      BEAD_REQUIRE_FAILURE( sel, too_many_inputs );
      BOOST_CHECK_EQUAL( sel.error().context["required_inputs"].as_uint64(), 3u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( token_inputs_largest_first )
{
   try {
      auto wallet = wallet_of( { 20, 20, 20 } );
      wallet[0].assets["beadpolicy.BEAD PR"] = 5;
      wallet[1].assets["beadpolicy.BEAD PR"] = 40;

      auto picked = select_token_inputs( wallet, "beadpolicy.BEAD PR", 30, small_policy() );
      BEAD_REQUIRE_SUCCESS( picked );
      BOOST_REQUIRE_EQUAL( picked->size(), 1u );
      BOOST_CHECK( picked->front().id == wallet[1].id );

      auto short_of = select_token_inputs( wallet, "beadpolicy.BEAD PR", 50, small_policy() );
      BEAD_REQUIRE_FAILURE( short_of, insufficient_funds );

      BOOST_CHECK_EQUAL( native_only( wallet ).size(), 1u );
      BOOST_CHECK_EQUAL( outputs_holding( wallet, "beadpolicy.BEAD PR" ).size(), 2u );
   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
