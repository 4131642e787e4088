#pragma once

#include <bead/protocol/operations.hpp>
#include <bead/protocol/protocol_config.hpp>
#include <bead/protocol/result.hpp>

namespace bead { namespace wallet {

   using namespace bead::protocol;

   /** Split of a token purchase between treasury and referrer, in lovelace */
   struct ada_distribution
   {
      ada_distribution():treasury(0),referral(0),referral_bonus_bps(0){}

      share_type   treasury;
      share_type   referral;
      uint32_t     referral_bonus_bps;
   };

   struct bet_accounting
   {
      bet_accounting():bet_tokens(0),bead_burned(0),pot_value(0){}

      asset_unit_type       bet_unit;
      share_type            bet_tokens;
      share_type            bead_burned;
      /** lovelace locked at the pot, at least the minimum output value */
      share_type            pot_value;
      vector<token_delta>   deltas;
   };

   struct purchase_accounting
   {
      purchase_accounting():contribution(0),bead_minted(0),referral_minted(0),referrer_output_value(0){}

      share_type                   contribution;
      purchase_tier                tier;
      share_type                   bead_minted;
      share_type                   referral_minted;
      optional<ada_distribution>   distribution;
      optional<uint32_t>           referral_bonus_bps;
      /** lovelace on the referrer output; tops up the referral share to the minimum output value */
      share_type                   referrer_output_value;
      vector<token_delta>          deltas;
      vector<string>               warnings;
   };

   struct redemption_accounting
   {
      redemption_accounting():held_tokens(0),payout(0),multiplier(0),eligible(false),refunded(false){}

      asset_unit_type       bet_unit;
      share_type            held_tokens;
      share_type            payout;
      double                multiplier;
      bool                  eligible;
      /** nobody won, every stake is returned at par */
      bool                  refunded;
      vector<token_delta>   deltas;
      vector<string>        warnings;
   };

   struct outcome_tally
   {
      outcome_tally():bets(0),tokens(0),lovelace(0){}

      uint32_t     bets;
      share_type   tokens;
      share_type   lovelace;
   };

   struct publication_accounting
   {
      publication_accounting():treasury_fee(0){}

      oracle_record                    record;
      asset_unit_type                  oracle_unit;
      map<game_outcome, outcome_tally> tally;
      share_type                       treasury_fee;
      vector<token_delta>              deltas;
      vector<string>                   warnings;
   };

   struct collection_accounting
   {
      collection_accounting():collected(0){}

      vector<spendable_output>   swept;
      share_type                 collected;
      vector<token_delta>        deltas;
      vector<string>             warnings;
   };

   /** Lovelace locked at the pot by a bet: the stake, topped up to the minimum output value */
   share_type bet_pot_value( share_type stake, const protocol_config& config );

   /** Share of a contribution paid to the referrer, in basis points */
   uint32_t referral_bonus_bps( const purchase_tier& tier, const protocol_config& config );

   /**
    *  Lovelace the buyer sends to treasury and referrer, including the top-up of a
    *  referrer output below the minimum output value.  Throws when no tier is reached.
    */
   share_type purchase_outlay( const purchase_token_request& request, const protocol_config& config );

   /**
    *  Mints stake + bead_stake * scale bet tokens for the predicted outcome and burns the
    *  staked BEAD.  Assumes a validated request.
    */
   result<bet_accounting> account_place_bet( const place_bet_request& request, const protocol_config& config );

   /**
    *  Looks up the purchase tier, computes BEAD and referral token mints and, when a referrer
    *  is given, the treasury / referrer split of the contribution.
    */
   result<purchase_accounting> account_purchase( const purchase_token_request& request, const protocol_config& config );

   /**
    *  Burns all held_tokens of bet_unit and computes the payout they entitle to under record.
    *
    *  payout = floor( held * total_pool / total_winnings ) when eligible, zero otherwise.  A
    *  record with zero total winnings refunds every holder at par.
    */
   result<redemption_accounting> account_redemption( const asset_unit_type& bet_unit,
                                                     share_type held_tokens,
                                                     const oracle_record& record,
                                                     bool eligible,
                                                     const protocol_config& config );

   /**
    *  Tallies the bets locked at the pot and builds the oracle record for the winner, along with
    *  the single oracle token that carries it.
    */
   result<publication_accounting> account_game_result( const publish_game_result_request& request,
                                                       const vector<spendable_output>& pot,
                                                       const time_point_sec& now,
                                                       const protocol_config& config );

   /**
    *  Sweeps what the pot still holds for one game: its oracle outputs and any bet outputs
    *  left unredeemed.  Burns the oracle tokens and collects the native remainder minus the
    *  fee.  Outputs of other games are left alone.
    *
    *  Fails with game_not_found when no oracle output for the game sits at the pot and with
    *  oracle_not_settled when none of them carries a settled outcome.
    */
   result<collection_accounting> account_collection( const collect_treasury_request& request,
                                                     const vector<spendable_output>& pot,
                                                     const protocol_config& config );

} } // bead::wallet

FC_REFLECT( bead::wallet::ada_distribution, (treasury)(referral)(referral_bonus_bps) )
FC_REFLECT( bead::wallet::bet_accounting, (bet_unit)(bet_tokens)(bead_burned)(pot_value)(deltas) )
FC_REFLECT( bead::wallet::purchase_accounting,
            (contribution)(tier)(bead_minted)(referral_minted)(distribution)(referral_bonus_bps)
            (referrer_output_value)(deltas)(warnings) )
FC_REFLECT( bead::wallet::redemption_accounting,
            (bet_unit)(held_tokens)(payout)(multiplier)(eligible)(refunded)(deltas)(warnings) )
FC_REFLECT( bead::wallet::outcome_tally, (bets)(tokens)(lovelace) )
FC_REFLECT( bead::wallet::publication_accounting, (record)(oracle_unit)(tally)(treasury_fee)(deltas)(warnings) )
FC_REFLECT( bead::wallet::collection_accounting, (swept)(collected)(deltas)(warnings) )
