#pragma once

#include <fc/time.hpp>

namespace pifp { namespace blockchain {

   /** wall clock time, or the simulated clock once start_simulated_time() has been called */
   fc::time_point_sec           now();

   void                         start_simulated_time( const fc::time_point sim_time );
   void                         advance_time( int32_t delta_seconds );
   void                         stop_simulated_time();
   bool                         is_simulated_time();

} } // pifp::blockchain
