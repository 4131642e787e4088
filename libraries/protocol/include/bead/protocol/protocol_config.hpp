#pragma once

#include <bead/protocol/asset.hpp>

#include <fc/filesystem.hpp>

namespace bead { namespace protocol {

   /** Parameters of the input selector */
   struct selection_policy
   {
      selection_policy();

      share_type   dust_threshold;
      share_type   min_output_value;
      uint32_t     max_inputs;
      uint32_t     optimal_candidate_limit;
      uint32_t     optimal_max_inputs;
      share_type   optimal_slack_tolerance;
   };

   /**
    *  One row of the token purchase table.  Contributions at or above threshold earn
    *  bead_amount and referral_amount per threshold of contributed lovelace.
    */
   struct purchase_tier
   {
      purchase_tier():threshold(0),bead_amount(0),referral_amount(0){}
      purchase_tier( share_type t, share_type b, share_type r ):threshold(t),bead_amount(b),referral_amount(r){}

      share_type   threshold;
      share_type   bead_amount;
      share_type   referral_amount;
   };

   /**
    *  Immutable configuration of a deployment.  A copy is passed into every entry
    *  point; nothing is read from process wide state.
    */
   struct protocol_config
   {
      protocol_config();

      static protocol_config defaults();
      static protocol_config load( const fc::path& config_file );

      /** Throws if the configuration cannot be used, e.g. an unordered tier table */
      void validate()const;

      asset_unit_type bead_unit()const;
      asset_unit_type referral_unit()const;

      /** Highest tier whose threshold the contribution reaches, if any */
      optional<purchase_tier> tier_for( share_type contribution )const;

      string                   network;
      policy_id_type           bead_policy_id;
      string                   bead_token_name;
      string                   referral_token_name;
      address_type             treasury_address;

      selection_policy         selection;
      share_type               network_fee;
      uint32_t                 transaction_expiration_sec;

      share_type               bead_scale_factor;
      share_type               min_bet_stake;
      share_type               max_bet_stake;
      share_type               max_bead_stake;
      game_id_type             max_game_id;
      uint32_t                 min_game_name_length;
      uint32_t                 max_game_name_length;
      uint32_t                 max_result_label_length;
      uint32_t                 max_game_horizon_sec;

      vector<purchase_tier>    purchase_tiers;
      uint32_t                 max_referral_percent_bps;
      uint32_t                 treasury_fee_bps;

      share_type               min_payout;
      share_type               max_payout;
      uint32_t                 min_payout_efficiency_percent;
      uint32_t                 max_oracle_age_sec;
      share_type               oracle_payout_value;
   };

} } // bead::protocol

FC_REFLECT( bead::protocol::selection_policy,
            (dust_threshold)
            (min_output_value)
            (max_inputs)
            (optimal_candidate_limit)
            (optimal_max_inputs)
            (optimal_slack_tolerance)
          )
FC_REFLECT( bead::protocol::purchase_tier, (threshold)(bead_amount)(referral_amount) )
FC_REFLECT( bead::protocol::protocol_config,
            (network)
            (bead_policy_id)
            (bead_token_name)
            (referral_token_name)
            (treasury_address)
            (selection)
            (network_fee)
            (transaction_expiration_sec)
            (bead_scale_factor)
            (min_bet_stake)
            (max_bet_stake)
            (max_bead_stake)
            (max_game_id)
            (min_game_name_length)
            (max_game_name_length)
            (max_result_label_length)
            (max_game_horizon_sec)
            (purchase_tiers)
            (max_referral_percent_bps)
            (treasury_fee_bps)
            (min_payout)
            (max_payout)
            (min_payout_efficiency_percent)
            (max_oracle_age_sec)
            (oracle_payout_value)
          )
