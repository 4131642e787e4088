#pragma once

#include <bead/protocol/types.hpp>

#include <fc/exception/exception.hpp>

namespace bead { namespace protocol {

   /**
    *  Closed set of failure classes reported across the public entry points.  The
    *  numbering is stable; callers may persist it.
    */
   enum failure_code
   {
      invalid_input      = 1,
      insufficient_funds = 2,
      too_many_inputs    = 3,
      game_not_found     = 4,
      oracle_not_settled = 5,
      policy_mismatch    = 6,
      accounting_error   = 7,
      transaction_failed = 8,
      network_error      = 9
   };

   /** Upper case external name, e.g. INSUFFICIENT_FUNDS */
   string failure_code_name( failure_code code );

   /** Remediation hints used when a component has nothing more specific to say */
   vector<string> default_suggestions( failure_code code );

   struct failure
   {
      failure():code(invalid_input){}
      failure( failure_code c,
               const string& msg,
               const variant_object& ctx = variant_object(),
               const vector<string>& hints = vector<string>() );

      failure_code      code;
      string            message;
      variant_object    context;
      vector<string>    suggestions;

      /** Returns a copy with one more context entry; an existing key is replaced */
      failure with_context( const string& key, const variant& value )const;

      string to_string()const;
   };

   /**
    *  Converts an exception that reached a component boundary.  The exception detail
    *  is kept in the context so nothing is lost for diagnostics.
    */
   failure failure_from_exception( failure_code code, const string& message, const fc::exception& e );

   /**
    *  Success or failure of a fallible operation; exactly one of the two is held.
    */
   template<typename T>
   class result
   {
      public:
         result( const T& v ):_value(v){}
         result( const failure& f ):_failure(f){}

         bool is_success()const { return _value.valid(); }
         bool is_failure()const { return !_value.valid(); }

         const T& value()const
         {
            FC_ASSERT( is_success(), "result holds a failure: ${m}", ("m", _failure->message) );
            return *_value;
         }

         const failure& error()const
         {
            FC_ASSERT( is_failure(), "result holds a value" );
            return *_failure;
         }

         const T& operator*()const  { return value(); }
         const T* operator->()const { return &value(); }

      private:
         optional<T>        _value;
         optional<failure>  _failure;
   };

   template<typename T>
   bool is_success( const result<T>& r ) { return r.is_success(); }

   template<typename T>
   bool is_failure( const result<T>& r ) { return r.is_failure(); }

} } // bead::protocol

FC_REFLECT_ENUM( bead::protocol::failure_code,
                 (invalid_input)
                 (insufficient_funds)
                 (too_many_inputs)
                 (game_not_found)
                 (oracle_not_settled)
                 (policy_mismatch)
                 (accounting_error)
                 (transaction_failed)
                 (network_error)
               )
FC_REFLECT( bead::protocol::failure, (code)(message)(context)(suggestions) )
