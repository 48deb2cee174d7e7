#include "stats.hh"

#include <iomanip>
#include <sstream>

using namespace std;
using namespace std::chrono;

namespace fanout {

string JobStats::str() const
{
  ostringstream oss;

  oss << fixed << setprecision( 3 )
      << "elapsed=" << duration_cast<duration<double>>( elapsed ).count() << "s"
      << " slots=" << slot_count << " batches=" << batches_dispatched << "/"
      << batches_planned << " peak_in_flight=" << peak_in_flight
      << " not_started=" << not_started;

  for ( size_t i = 0; i < slots.size(); i++ ) {
    oss << " [" << i << ": " << slots[i].tasks << "t/" << slots[i].batches
        << "b" << ( slots[i].died ? " died" : "" ) << "]";
  }

  return oss.str();
}

} // namespace fanout
