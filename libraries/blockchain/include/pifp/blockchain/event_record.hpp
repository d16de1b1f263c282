#pragma once

#include <pifp/blockchain/proof_record.hpp>
#include <pifp/blockchain/role_record.hpp>

namespace pifp { namespace blockchain {

enum event_type
{
    project_registered_event    = 0,
    donation_received_event     = 1,
    proof_submitted_event       = 2,
    proof_verified_event        = 3,
    funds_released_event        = 4,
    refunded_event              = 5,
    project_expired_event       = 6,
    role_granted_event          = 7,
    role_revoked_event          = 8
};

/**
 *  Notification emitted by a successfully applied operation for off-chain
 *  indexers.  Events of a transaction are discarded with it if any of its
 *  operations fails; committed events are journaled by the chain database
 *  under a strictly increasing sequence number.
 */
struct event_record
{
    event_record(){}
    event_record( event_type t, project_id_type pid )
        :type(t),project_id(pid){}

    uint64_t                                    sequence = 0;
    fc::enum_type<uint8_t,event_type>           type = project_registered_event;
    project_id_type                             project_id = 0;
    share_type                                  amount = 0;
    optional<address>                           account;
    optional<donation_id_type>                  donation_id;
    optional<submission_id_type>                submission;
    optional<fc::enum_type<uint8_t,verdict_type>> verdict;
    optional<fc::enum_type<uint8_t,role_type>>  role;
    time_point_sec                              timestamp;
    transaction_id_type                         transaction_id;
};
typedef vector<event_record> event_records;

} } // pifp::blockchain

FC_REFLECT_ENUM( pifp::blockchain::event_type,
        (project_registered_event)
        (donation_received_event)
        (proof_submitted_event)
        (proof_verified_event)
        (funds_released_event)
        (refunded_event)
        (project_expired_event)
        (role_granted_event)
        (role_revoked_event)
        )
FC_REFLECT( pifp::blockchain::event_record,
        (sequence)
        (type)
        (project_id)
        (amount)
        (account)
        (donation_id)
        (submission)
        (verdict)
        (role)
        (timestamp)
        (transaction_id)
        )
