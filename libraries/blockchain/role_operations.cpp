#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/role_operations.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   namespace detail
   {
      void assign_role( transaction_evaluation_state& eval_state, const address& caller, const address& target, role_type role )
      { try {
         pending_chain_state* const pending_state = eval_state.pending_state();

         role_record record;
         record.holder = target;
         record.role = role;
         record.granted_by = caller;
         record.granted_at = pending_state->now();
         record.authority_version = pending_state->bump_authority_version();
         pending_state->store_role_record( record );

         ilog( "${caller} granted ${role} to ${target}", ("caller",caller)("role",record.role)("target",target) );

         event_record event( role_granted_event, 0 );
         event.account = target;
         event.role = record.role;
         eval_state.emit( event );
      } FC_CAPTURE_AND_RETHROW( (caller)(target)(role) ) }

      void drop_role( transaction_evaluation_state& eval_state, const address& target )
      { try {
         pending_chain_state* const pending_state = eval_state.pending_state();

         const orole_record record = pending_state->get_role_record( target );
         FC_ASSERT( record.valid() );

         pending_state->remove_role_record( target );
         pending_state->bump_authority_version();

         ilog( "revoked ${role} from ${target}", ("role",record->role)("target",target) );

         event_record event( role_revoked_event, 0 );
         event.account = target;
         event.role = record->role;
         eval_state.emit( event );
      } FC_CAPTURE_AND_RETHROW( (target) ) }
   }

   void grant_role_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( !eval_state.check_signature( this->caller ) )
         FC_CAPTURE_AND_THROW( missing_signature, (caller) );

      const role_type caller_role = eval_state.pending_state()->get_role( this->caller );
      if( caller_role != super_admin_role && caller_role != admin_role )
         FC_CAPTURE_AND_THROW( unauthorized, (caller)(caller_role) );

      if( this->role == super_admin_role )
      {
         if( caller_role == super_admin_role )
            FC_CAPTURE_AND_THROW( invalid_parameters, (role) );
         FC_CAPTURE_AND_THROW( unauthorized, (caller)(role) );
      }

      if( this->role == no_role || this->role > auditor_role || this->target.is_null() )
         FC_CAPTURE_AND_THROW( invalid_parameters, (target)(role) );

      if( eval_state.pending_state()->get_role( this->target ) == super_admin_role )
         FC_CAPTURE_AND_THROW( unauthorized, (target) );

      detail::assign_role( eval_state, this->caller, this->target, this->role );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void revoke_role_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( !eval_state.check_signature( this->caller ) )
         FC_CAPTURE_AND_THROW( missing_signature, (caller) );

      const role_type caller_role = eval_state.pending_state()->get_role( this->caller );
      if( caller_role != super_admin_role && caller_role != admin_role )
         FC_CAPTURE_AND_THROW( unauthorized, (caller)(caller_role) );

      const role_type target_role = eval_state.pending_state()->get_role( this->target );
      if( target_role == super_admin_role )
         FC_CAPTURE_AND_THROW( unauthorized, (target) );

      if( target_role == no_role )
         return;

      detail::drop_role( eval_state, this->target );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void transfer_super_admin_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      pending_chain_state* const pending_state = eval_state.pending_state();

      if( !eval_state.check_signature( this->current_admin ) )
         FC_CAPTURE_AND_THROW( missing_signature, (current_admin) );

      const optional<address> super_admin = pending_state->get_super_admin();
      if( !super_admin.valid() || *super_admin != this->current_admin )
         FC_CAPTURE_AND_THROW( unauthorized, (current_admin)(super_admin) );

      if( this->new_admin.is_null() || this->new_admin == this->current_admin )
         FC_CAPTURE_AND_THROW( invalid_parameters, (new_admin) );

      detail::drop_role( eval_state, this->current_admin );
      detail::assign_role( eval_state, this->current_admin, this->new_admin, super_admin_role );
      pending_state->store_property_record( property_id_type::super_admin, variant( this->new_admin ) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pifp::blockchain
