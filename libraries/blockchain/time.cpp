#include <pifp/blockchain/time.hpp>

#include <atomic>

namespace pifp { namespace blockchain {

static std::atomic<uint32_t> simulated_time( 0 );
static std::atomic<int32_t>  adjusted_time_sec( 0 );

fc::time_point_sec now()
{
   if( simulated_time )
       return fc::time_point() + fc::seconds( int64_t( simulated_time ) + adjusted_time_sec );

   return fc::time_point::now() + fc::seconds( adjusted_time_sec );
}

void start_simulated_time( const fc::time_point sim_time )
{
   simulated_time = sim_time.sec_since_epoch();
   adjusted_time_sec = 0;
}

void advance_time( int32_t delta_seconds )
{
   adjusted_time_sec += delta_seconds;
}

void stop_simulated_time()
{
   simulated_time = 0;
   adjusted_time_sec = 0;
}

bool is_simulated_time()
{
   return simulated_time != 0;
}

} } // pifp::blockchain
