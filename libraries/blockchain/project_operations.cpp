#include <pifp/blockchain/exceptions.hpp>
#include <pifp/blockchain/pending_chain_state.hpp>
#include <pifp/blockchain/project_operations.hpp>
#include <pifp/blockchain/transaction_evaluation_state.hpp>

namespace pifp { namespace blockchain {

   void register_project_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( !eval_state.check_signature( this->creator ) )
         FC_CAPTURE_AND_THROW( missing_signature, (creator) );

      const orole_record creator_role = eval_state.pending_state()->get_role_record( this->creator );
      if( !creator_role.valid() || !creator_role->can_register_projects() )
         FC_CAPTURE_AND_THROW( unauthorized, (creator)(creator_role) );

      if( this->target <= 0 || this->target > PIFP_BLOCKCHAIN_MAX_SHARES )
         FC_CAPTURE_AND_THROW( invalid_parameters, (target) );

      const time_point_sec now = eval_state.pending_state()->now();
      if( this->deadline <= now )
         FC_CAPTURE_AND_THROW( invalid_parameters, (deadline)(now) );

      if( this->deadline > now + PIFP_BLOCKCHAIN_MAX_PROJECT_DURATION_SEC )
         FC_CAPTURE_AND_THROW( invalid_parameters, (deadline)(now) );

      project_record project;
      project.id = eval_state.pending_state()->new_project_id();
      project.creator = this->creator;
      project.implementer = this->implementer.is_null() ? this->creator : this->implementer;
      project.target = this->target;
      project.deadline = this->deadline;
      project.proof_schema_hash = this->proof_schema_hash;
      project.status = funding_status;
      project.registration_date = now;
      project.last_update = now;

      eval_state.pending_state()->store_project_record( project );

      event_record event( project_registered_event, project.id );
      event.account = project.creator;
      event.amount = project.target;
      eval_state.emit( event );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void deposit_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      if( this->amount <= 0 )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount) );

      oproject_record project = eval_state.pending_state()->get_project_record( this->project_id );
      if( !project.valid() )
         FC_CAPTURE_AND_THROW( unknown_project, (project_id) );

      const time_point_sec now = eval_state.pending_state()->now();
      if( project->status != funding_status || project->is_past_deadline( now ) )
         FC_CAPTURE_AND_THROW( invalid_state, (project->status)(project->deadline)(now) );

      if( this->amount > project->target - project->funded_amount )
         FC_CAPTURE_AND_THROW( invalid_amount, (amount)(project->funded_amount)(project->target) );

      eval_state.sub_balance( this->amount );

      project->funded_amount += this->amount;
      project->donation_count += 1;
      if( project->funded_amount >= project->target )
      {
         ilog( "project ${id} reached its target of ${target}", ("id",project->id)("target",project->target) );
         project->status = active_status;
      }
      project->last_update = now;
      eval_state.pending_state()->store_project_record( *project );

      donation_record donation;
      donation.index.project_id = project->id;
      donation.index.donation_id = project->donation_count;
      donation.donor_commitment = this->donor_commitment;
      donation.amount = this->amount;
      donation.timestamp = now;
      eval_state.pending_state()->store_donation_record( donation );

      event_record event( donation_received_event, project->id );
      event.amount = this->amount;
      event.donation_id = donation.index.donation_id;
      eval_state.emit( event );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void submit_proof_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      oproject_record project = eval_state.pending_state()->get_project_record( this->project_id );
      if( !project.valid() )
         FC_CAPTURE_AND_THROW( unknown_project, (project_id) );

      if( !eval_state.check_signature( project->implementer ) )
         FC_CAPTURE_AND_THROW( missing_signature, (project->implementer) );

      const time_point_sec now = eval_state.pending_state()->now();
      if( project->status != active_status || project->is_past_deadline( now ) )
         FC_CAPTURE_AND_THROW( invalid_state, (project->status)(project->deadline)(now) );

      project->submission_count += 1;
      project->active_submission = project->submission_count;
      project->status = proof_submitted_status;
      project->last_update = now;
      eval_state.pending_state()->store_project_record( *project );

      proof_record proof;
      proof.index.project_id = project->id;
      proof.index.submission = project->active_submission;
      proof.proof_commitment = this->proof_commitment;
      proof.submitter = project->implementer;
      proof.timestamp = now;
      eval_state.pending_state()->store_proof_record( proof );

      event_record event( proof_submitted_event, project->id );
      event.submission = proof.index.submission;
      eval_state.emit( event );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

   void check_expiry_operation::evaluate( transaction_evaluation_state& eval_state )const
   { try {
      oproject_record project = eval_state.pending_state()->get_project_record( this->project_id );
      if( !project.valid() )
         FC_CAPTURE_AND_THROW( unknown_project, (project_id) );

      if( project->status == completed_status )
         FC_CAPTURE_AND_THROW( invalid_state, (project->status) );

      const time_point_sec now = eval_state.pending_state()->now();
      if( project->status == expired_status || !project->is_past_deadline( now ) )
         return;

      ilog( "project ${id} expired at ${deadline}", ("id",project->id)("deadline",project->deadline) );
      project->status = expired_status;
      project->active_submission = 0;
      project->last_update = now;
      eval_state.pending_state()->store_project_record( *project );

      eval_state.emit( event_record( project_expired_event, project->id ) );
   } FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // pifp::blockchain
