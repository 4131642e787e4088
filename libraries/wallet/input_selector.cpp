#include <bead/wallet/input_selector.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#include <algorithm>

namespace bead { namespace wallet {

   namespace detail
   {
      struct candidate
      {
         size_t      index;
         share_type  value;
      };

      struct selection_problem
      {
         vector<candidate>         spendable; ///< above the dust threshold, descending
         vector<candidate>         dust;      ///< descending
         share_type                preselected_value;
         share_type                needed;
         bool                      change_required;
         const selection_policy*   policy;

         bool acceptable( share_type total )const
         {
            if( total < needed ) return false;
            share_type change = total - needed;
            if( change == 0 ) return !change_required;
            return change >= policy->min_output_value;
         }
      };

      typedef optional<vector<candidate>> (*strategy_function)( const selection_problem& );

      struct combination_search
      {
         const selection_problem&   problem;
         const vector<candidate>&   pool;
         size_t                     size;

         vector<candidate>          current;
         vector<candidate>          best;
         share_type                 best_slack;
         bool                       found;

         combination_search( const selection_problem& p, const vector<candidate>& c, size_t s )
         :problem(p),pool(c),size(s),best_slack(0),found(false){}

         void run( size_t next, share_type sum )
         {
            if( current.size() == size )
            {
               if( !problem.acceptable( sum ) ) return;
               share_type slack = sum - problem.needed;
               if( !found || slack < best_slack )
               {
                  found = true;
                  best_slack = slack;
                  best = current;
               }
               return;
            }
            if( found && best_slack == 0 ) return;

            for( size_t i = next; i < pool.size(); ++i )
            {
               // pool is descending, so the remaining picks can add at most this much
               share_type reach = sum;
               for( size_t j = i; j < pool.size() && j < i + (size - current.size()); ++j )
                  reach = checked_add( reach, pool[j].value );
               if( reach < problem.needed ) return;

               current.push_back( pool[i] );
               run( i + 1, checked_add( sum, pool[i].value ) );
               current.pop_back();
            }
         }
      };

      optional<vector<candidate>> select_optimal( const selection_problem& problem )
      {
         const auto& policy = *problem.policy;
         vector<candidate> pool( problem.spendable.begin(),
                                 problem.spendable.begin() + std::min<size_t>( problem.spendable.size(),
                                                                               policy.optimal_candidate_limit ) );

         for( size_t size = 0; size <= policy.optimal_max_inputs && size <= pool.size(); ++size )
         {
            combination_search search( problem, pool, size );
            search.run( 0, problem.preselected_value );
            if( search.found && search.best_slack <= policy.optimal_slack_tolerance )
               return search.best;
         }
         return optional<vector<candidate>>();
      }

      optional<vector<candidate>> greedy_walk( const selection_problem& problem, const vector<candidate>& order )
      {
         vector<candidate> chosen;
         share_type total = problem.preselected_value;
         if( problem.acceptable( total ) )
            return chosen;

         for( const auto& c : order )
         {
            chosen.push_back( c );
            total = checked_add( total, c.value );
            if( problem.acceptable( total ) )
               return chosen;
         }
         return optional<vector<candidate>>();
      }

      optional<vector<candidate>> select_greedy( const selection_problem& problem )
      {
         return greedy_walk( problem, problem.spendable );
      }

      optional<vector<candidate>> select_with_dust( const selection_problem& problem )
      {
         vector<candidate> order( problem.spendable );
         order.insert( order.end(), problem.dust.begin(), problem.dust.end() );
         return greedy_walk( problem, order );
      }

      bool by_descending_value( const candidate& a, const candidate& b )
      {
         if( a.value != b.value ) return a.value > b.value;
         return a.index < b.index;
      }

      bool contains( const vector<spendable_output>& outputs, const output_reference& id )
      {
         for( const auto& o : outputs )
            if( o.id == id ) return true;
         return false;
      }
   }

   result<selection_result> select_inputs( const vector<spendable_output>& available,
                                           const selection_request& request,
                                           const selection_policy& policy )
   {
      try {
         FC_ASSERT( request.target >= 0 && request.fee_reserve >= 0, "selection target may not be negative" );

         if( request.preselected.size() > policy.max_inputs )
         {
            return failure( too_many_inputs,
                            "Spending the required outputs needs " + fc::to_string( uint64_t( request.preselected.size() ) ) +
                            " inputs, the limit is " + fc::to_string( uint64_t( policy.max_inputs ) ),
                            mutable_variant_object( "required_inputs", uint64_t( request.preselected.size() ) )
                                                  ( "max_inputs", policy.max_inputs ),
                            { "Consolidate token outputs into fewer outputs", "Redeem in several smaller transactions" } );
         }

         detail::selection_problem problem;
         problem.preselected_value = 0;
         problem.needed            = request.needed();
         problem.change_required   = request.change_required;
         problem.policy            = &policy;

         for( const auto& o : request.preselected )
            problem.preselected_value = checked_add( problem.preselected_value, o.native() );

         share_type total_available = problem.preselected_value;
         for( size_t i = 0; i < available.size(); ++i )
         {
            const auto& o = available[i];
            if( detail::contains( request.preselected, o.id ) ) continue;

            detail::candidate c{ i, o.native() };
            if( c.value < policy.dust_threshold )
               problem.dust.push_back( c );
            else
               problem.spendable.push_back( c );
            total_available = checked_add( total_available, c.value );
         }
         std::sort( problem.spendable.begin(), problem.spendable.end(), detail::by_descending_value );
         std::sort( problem.dust.begin(), problem.dust.end(), detail::by_descending_value );

         if( total_available < problem.needed )
         {
            return failure( insufficient_funds,
                            "Insufficient funds: need " + fc::to_string( problem.needed ) +
                            " lovelace, wallet holds " + fc::to_string( total_available ),
                            mutable_variant_object( "target", request.target )
                                                  ( "fee_reserve", request.fee_reserve )
                                                  ( "available", total_available )
                                                  ( "shortfall", problem.needed - total_available ),
                            { "Add more funds to your wallet", "Reduce the requested amount" } );
         }

         static const std::vector<std::pair<selection_strategy, detail::strategy_function>> strategies = {
            { optimal_selection,  &detail::select_optimal },
            { greedy_selection,   &detail::select_greedy },
            { fallback_selection, &detail::select_with_dust }
         };

         optional<size_t> over_capacity;

         for( const auto& strategy : strategies )
         {
            auto picked = strategy.second( problem );
            if( !picked.valid() ) continue;

            const size_t input_count = request.preselected.size() + picked->size();
            if( input_count > policy.max_inputs )
            {
               over_capacity = input_count;
               continue;
            }

            selection_result sel;
            sel.target      = request.target;
            sel.fee_reserve = request.fee_reserve;
            sel.strategy    = strategy.first;
            sel.total_input = problem.preselected_value;

            for( const auto& o : request.preselected )
            {
               sel.inputs.push_back( o.id );
               add_to( sel.gathered, o.assets );
            }
            uint32_t dust_used = 0;
            for( const auto& c : *picked )
            {
               const auto& o = available[c.index];
               sel.inputs.push_back( o.id );
               add_to( sel.gathered, o.assets );
               sel.total_input = checked_add( sel.total_input, c.value );
               if( c.value < policy.dust_threshold ) ++dust_used;
            }
            sel.change       = sel.total_input - problem.needed;
            sel.efficiency   = sel.total_input > 0 ? double( sel.target ) / double( sel.total_input ) : 1.0;
            sel.dust_skipped = uint32_t( problem.dust.size() ) - dust_used;

            dlog( "selected ${n} inputs totalling ${t} for ${need} using ${s}",
                  ("n", sel.inputs.size())("t", sel.total_input)("need", problem.needed)("s", sel.strategy) );
            return sel;
         }

         if( over_capacity.valid() )
         {
            return failure( too_many_inputs,
                            "Covering the amount needs " + fc::to_string( uint64_t( *over_capacity ) ) +
                            " inputs, the limit is " + fc::to_string( uint64_t( policy.max_inputs ) ),
                            mutable_variant_object( "required_inputs", uint64_t( *over_capacity ) )
                                                  ( "max_inputs", policy.max_inputs ),
                            { "Consolidate small outputs into a larger one", "Reduce the requested amount" } );
         }

         return failure( insufficient_funds,
                         "Insufficient funds to leave change of at least the minimum output value",
                         mutable_variant_object( "target", request.target )
                                               ( "fee_reserve", request.fee_reserve )
                                               ( "available", total_available )
                                               ( "min_output_value", policy.min_output_value ),
                         { "Add more funds to your wallet", "Reduce the requested amount" } );
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( invalid_input, "Unable to select inputs", e );
      }
   }

   result<vector<spendable_output>> select_token_inputs( const vector<spendable_output>& available,
                                                         const asset_unit_type& unit,
                                                         share_type quantity,
                                                         const selection_policy& policy )
   {
      try {
         FC_ASSERT( quantity >= 0 );

         auto holding = outputs_holding( available, unit );
         std::sort( holding.begin(), holding.end(), [&]( const spendable_output& a, const spendable_output& b ) {
            return a.quantity( unit ) > b.quantity( unit );
         });

         vector<spendable_output> chosen;
         share_type gathered = 0;
         for( const auto& o : holding )
         {
            if( gathered >= quantity ) break;
            chosen.push_back( o );
            gathered = checked_add( gathered, o.quantity( unit ) );
         }

         if( gathered < quantity )
         {
            return failure( insufficient_funds,
                            "Insufficient " + unit_name( unit ) + ": need " + fc::to_string( quantity ) +
                            ", wallet holds " + fc::to_string( gathered ),
                            mutable_variant_object( "unit", unit )( "required", quantity )( "available", gathered ),
                            { "Reduce the token amount", "Acquire more tokens before retrying" } );
         }
         if( chosen.size() > policy.max_inputs )
         {
            return failure( too_many_inputs,
                            "Gathering " + unit_name( unit ) + " needs more inputs than a transaction allows",
                            mutable_variant_object( "unit", unit )
                                                  ( "required_inputs", uint64_t( chosen.size() ) )
                                                  ( "max_inputs", policy.max_inputs ) );
         }
         return chosen;
      }
      catch( const fc::exception& e )
      {
         return failure_from_exception( invalid_input, "Unable to select token inputs", e );
      }
   }

   vector<spendable_output> outputs_holding( const vector<spendable_output>& available,
                                             const asset_unit_type& unit )
   {
      vector<spendable_output> holding;
      for( const auto& o : available )
         if( o.quantity( unit ) > 0 )
            holding.push_back( o );
      return holding;
   }

   vector<spendable_output> native_only( const vector<spendable_output>& available )
   {
      vector<spendable_output> plain;
      for( const auto& o : available )
         if( !has_tokens( o.assets ) && !o.oracle.valid() )
            plain.push_back( o );
      return plain;
   }

   vector<spendable_output> without( const vector<spendable_output>& available,
                                     const vector<spendable_output>& excluded )
   {
      vector<spendable_output> remaining;
      for( const auto& o : available )
         if( !detail::contains( excluded, o.id ) )
            remaining.push_back( o );
      return remaining;
   }

} } // bead::wallet
