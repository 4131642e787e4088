#pragma once

#define BEAD_NATIVE_UNIT                                    "lovelace"
#define BEAD_LOVELACE_PER_ADA                               int64_t( 1000000 )
#define BEAD_TOKEN_NAME                                     "BEAD PR"
#define BEAD_REFERRAL_TOKEN_NAME                            "BEADR PR"

/** Bet tokens are minted at 1:1 with lovelace, BEAD stake is scaled into the same unit */
#define BEAD_SCALE_FACTOR                                   int64_t( 1000000 )

#define BEAD_MIN_OUTPUT_VALUE                               ( 1 * BEAD_LOVELACE_PER_ADA )
#define BEAD_DUST_THRESHOLD                                 ( 1 * BEAD_LOVELACE_PER_ADA )
#define BEAD_MAX_INPUTS_PER_TRANSACTION                     50
#define BEAD_OPTIMAL_CANDIDATE_LIMIT                        16
#define BEAD_OPTIMAL_MAX_INPUTS                             2
#define BEAD_OPTIMAL_SLACK_TOLERANCE                        ( 2 * BEAD_LOVELACE_PER_ADA )

#define BEAD_DEFAULT_NETWORK_FEE                            int64_t( 300000 ) // lovelace
#define BEAD_DEFAULT_TRANSACTION_EXPIRATION_SEC             ( 60 * 60 )

#define BEAD_MIN_BET_STAKE                                  ( 10 * BEAD_LOVELACE_PER_ADA )
#define BEAD_MAX_BET_STAKE                                  ( 10000 * BEAD_LOVELACE_PER_ADA )
#define BEAD_MAX_BEAD_STAKE                                 int64_t( 50000 )

#define BEAD_MAX_GAME_ID                                    uint64_t( 999999 )
#define BEAD_MIN_GAME_NAME_LENGTH                           3
#define BEAD_MAX_GAME_NAME_LENGTH                           50
#define BEAD_MAX_RESULT_LABEL_LENGTH                        20
#define BEAD_MAX_GAME_HORIZON_SEC                           ( 365 * 24 * 60 * 60 )

#define BEAD_PERCENT_BPS                                    10000
#define BEAD_MAX_REFERRAL_PERCENT_BPS                       500
#define BEAD_TREASURY_FEE_BPS                               200

#define BEAD_MIN_PAYOUT                                     ( 1 * BEAD_LOVELACE_PER_ADA )
#define BEAD_MAX_PAYOUT                                     ( 1000000 * BEAD_LOVELACE_PER_ADA )
#define BEAD_MIN_PAYOUT_EFFICIENCY_PERCENT                  50
#define BEAD_MAX_ORACLE_AGE_SEC                             ( 24 * 60 * 60 )
#define BEAD_ORACLE_PAYOUT_VALUE                            ( 2 * BEAD_LOVELACE_PER_ADA )
