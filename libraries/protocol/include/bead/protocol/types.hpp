#pragma once

#include <fc/optional.hpp>
#include <fc/time.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>
#include <fc/reflect/reflect.hpp>

#include <map>
#include <tuple>
#include <set>
#include <string>
#include <vector>

namespace bead { namespace protocol {

    typedef int64_t                     share_type;
    typedef uint64_t                    game_id_type;
    typedef std::string                 address_type;
    typedef std::string                 asset_unit_type;
    typedef std::string                 policy_id_type;
    typedef std::string                 transaction_id_type;

    using std::string;
    using std::map;
    using std::set;
    using std::vector;
    using std::pair;
    using fc::variant;
    using fc::variant_object;
    using fc::mutable_variant_object;
    using fc::optional;
    using fc::time_point_sec;
    using fc::time_point;
    using fc::microseconds;

    /** Match outcome as it is encoded in bet token names and oracle records. */
    enum game_outcome
    {
        tie_outcome  = 0,
        home_outcome = 1,
        away_outcome = 2
    };

    bool   is_defined_outcome( int64_t value );
    char   outcome_digit( game_outcome o );
    string outcome_description( game_outcome o );

    /**
     *  Reference to the scripts a game is bound to.  Policy ids and addresses are
     *  opaque strings supplied by the surrounding layers.
     */
    struct contract_references
    {
        policy_id_type  bet_policy_id;
        policy_id_type  oracle_policy_id;
        address_type    pot_address;
    };

    /** Identity of a game as carried by every game-bound request. */
    struct game_reference
    {
        game_reference():id(0){}

        game_id_type    id;
        string          name;
        time_point_sec  start_time;
    };

} } // bead::protocol

FC_REFLECT_ENUM( bead::protocol::game_outcome, (tie_outcome)(home_outcome)(away_outcome) )
FC_REFLECT( bead::protocol::contract_references, (bet_policy_id)(oracle_policy_id)(pot_address) )
FC_REFLECT( bead::protocol::game_reference, (id)(name)(start_time) )
