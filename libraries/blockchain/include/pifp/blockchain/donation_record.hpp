#pragma once

#include <pifp/blockchain/types.hpp>

#include <tuple>

namespace pifp { namespace blockchain {

struct donation_index
{
    donation_index(){}
    donation_index( project_id_type pid, donation_id_type did )
        :project_id(pid),donation_id(did){}

    project_id_type     project_id = 0;
    donation_id_type    donation_id = 0;

    friend bool operator < ( const donation_index& a, const donation_index& b )
    {
        return std::tie( a.project_id, a.donation_id ) < std::tie( b.project_id, b.donation_id );
    }

    friend bool operator == ( const donation_index& a, const donation_index& b )
    {
        return std::tie( a.project_id, a.donation_id ) == std::tie( b.project_id, b.donation_id );
    }
};

enum donation_state
{
    donation_locked     = 0,
    donation_released   = 1,
    donation_refunded   = 2
};

struct donation_record;
typedef fc::optional<donation_record> odonation_record;

class chain_interface;

/**
 *  A deposit against a project.  The donor is known only through the
 *  commitment; the record is immutable apart from its settlement state,
 *  which leaves donation_locked exactly once.
 */
struct donation_record
{
    bool is_settled()const { return state != donation_locked; }

    donation_index                              index;
    commitment_type                             donor_commitment;
    share_type                                  amount = 0;
    time_point_sec                              timestamp;
    fc::enum_type<uint8_t,donation_state>       state = donation_locked;
    time_point_sec                              settled_at;

    void sanity_check( const chain_interface& )const;
    static odonation_record lookup( const chain_interface&, const donation_index& );
    static void store( chain_interface&, const donation_index&, const donation_record& );
    static void remove( chain_interface&, const donation_index& );
};

class donation_db_interface
{
    friend struct donation_record;

    virtual odonation_record donation_lookup_by_index( const donation_index& )const = 0;
    virtual void donation_insert_into_index_map( const donation_index&, const donation_record& ) = 0;
    virtual void donation_erase_from_index_map( const donation_index& ) = 0;
};

} } // pifp::blockchain

FC_REFLECT( pifp::blockchain::donation_index, (project_id)(donation_id) )
FC_REFLECT_ENUM( pifp::blockchain::donation_state, (donation_locked)(donation_released)(donation_refunded) )
FC_REFLECT( pifp::blockchain::donation_record, (index)(donor_commitment)(amount)(timestamp)(state)(settled_at) )
