#include <bead/protocol/protocol_config.hpp>
#include <bead/protocol/config.hpp>
#include <bead/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace bead { namespace protocol {

   selection_policy::selection_policy()
   :dust_threshold( BEAD_DUST_THRESHOLD ),
    min_output_value( BEAD_MIN_OUTPUT_VALUE ),
    max_inputs( BEAD_MAX_INPUTS_PER_TRANSACTION ),
    optimal_candidate_limit( BEAD_OPTIMAL_CANDIDATE_LIMIT ),
    optimal_max_inputs( BEAD_OPTIMAL_MAX_INPUTS ),
    optimal_slack_tolerance( BEAD_OPTIMAL_SLACK_TOLERANCE )
   {}

   protocol_config::protocol_config()
   :network( "Preprod" ),
    bead_token_name( BEAD_TOKEN_NAME ),
    referral_token_name( BEAD_REFERRAL_TOKEN_NAME ),
    network_fee( BEAD_DEFAULT_NETWORK_FEE ),
    transaction_expiration_sec( BEAD_DEFAULT_TRANSACTION_EXPIRATION_SEC ),
    bead_scale_factor( BEAD_SCALE_FACTOR ),
    min_bet_stake( BEAD_MIN_BET_STAKE ),
    max_bet_stake( BEAD_MAX_BET_STAKE ),
    max_bead_stake( BEAD_MAX_BEAD_STAKE ),
    max_game_id( BEAD_MAX_GAME_ID ),
    min_game_name_length( BEAD_MIN_GAME_NAME_LENGTH ),
    max_game_name_length( BEAD_MAX_GAME_NAME_LENGTH ),
    max_result_label_length( BEAD_MAX_RESULT_LABEL_LENGTH ),
    max_game_horizon_sec( BEAD_MAX_GAME_HORIZON_SEC ),
    max_referral_percent_bps( BEAD_MAX_REFERRAL_PERCENT_BPS ),
    treasury_fee_bps( BEAD_TREASURY_FEE_BPS ),
    min_payout( BEAD_MIN_PAYOUT ),
    max_payout( BEAD_MAX_PAYOUT ),
    min_payout_efficiency_percent( BEAD_MIN_PAYOUT_EFFICIENCY_PERCENT ),
    max_oracle_age_sec( BEAD_MAX_ORACLE_AGE_SEC ),
    oracle_payout_value( BEAD_ORACLE_PAYOUT_VALUE )
   {
      const share_type ada = BEAD_LOVELACE_PER_ADA;
      purchase_tiers.push_back( purchase_tier(  200 * ada,  1000,  5 ) );
      purchase_tiers.push_back( purchase_tier(  400 * ada,  2040, 10 ) );
      purchase_tiers.push_back( purchase_tier(  600 * ada,  3090, 15 ) );
      purchase_tiers.push_back( purchase_tier(  800 * ada,  4060, 20 ) );
      purchase_tiers.push_back( purchase_tier( 1000 * ada,  5250, 25 ) );
      purchase_tiers.push_back( purchase_tier( 2000 * ada, 10500, 50 ) );
   }

   protocol_config protocol_config::defaults()
   {
      return protocol_config();
   }

   protocol_config protocol_config::load( const fc::path& config_file )
   { try {
      FC_ASSERT( fc::exists( config_file ), "configuration file does not exist" );

      // fields missing from the file keep their default value
      protocol_config cfg;
      fc::from_variant( fc::json::from_file( config_file ), cfg );
      cfg.validate();

      ilog( "loaded protocol configuration for ${n}", ("n", cfg.network) );
      return cfg;
   } FC_CAPTURE_AND_RETHROW( (config_file) ) }

   void protocol_config::validate()const
   { try {
      FC_ASSERT( !bead_policy_id.empty(), "BEAD policy id is not configured" );
      FC_ASSERT( !treasury_address.empty(), "treasury address is not configured" );
      FC_ASSERT( bead_scale_factor > 0 );
      FC_ASSERT( network_fee >= 0 );
      FC_ASSERT( selection.min_output_value >= 0 && selection.dust_threshold >= 0 );
      FC_ASSERT( selection.max_inputs > 0 );
      FC_ASSERT( min_bet_stake <= max_bet_stake );
      FC_ASSERT( max_referral_percent_bps <= BEAD_PERCENT_BPS );

      if( purchase_tiers.empty() )
         FC_THROW_EXCEPTION( invalid_tier_table, "no purchase tiers configured" );
      share_type previous = 0;
      for( const auto& tier : purchase_tiers )
      {
         if( tier.threshold <= previous || tier.bead_amount <= 0 || tier.referral_amount < 0 )
            FC_THROW_EXCEPTION( invalid_tier_table, "tiers must have increasing thresholds and positive amounts",
                                ("tier", tier)("previous_threshold", previous) );
         previous = tier.threshold;
      }
   } FC_CAPTURE_AND_RETHROW() }

   asset_unit_type protocol_config::bead_unit()const
   {
      return make_unit( bead_policy_id, bead_token_name );
   }

   asset_unit_type protocol_config::referral_unit()const
   {
      return make_unit( bead_policy_id, referral_token_name );
   }

   optional<purchase_tier> protocol_config::tier_for( share_type contribution )const
   {
      optional<purchase_tier> found;
      for( const auto& tier : purchase_tiers )
      {
         if( contribution >= tier.threshold )
            found = tier;
      }
      return found;
   }

} } // bead::protocol
