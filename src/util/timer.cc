#include "timer.hh"

#include <iomanip>
#include <sstream>

using namespace std;

string format_duration( const uint64_t duration_ns )
{
  constexpr double THOUSAND = 1e3;
  constexpr double MILLION = 1e6;
  constexpr double BILLION = 1e9;

  ostringstream out;
  out << fixed << setprecision( 1 );

  if ( duration_ns < THOUSAND ) {
    out << duration_ns << " ns";
  } else if ( duration_ns < MILLION ) {
    out << duration_ns / THOUSAND << " us";
  } else if ( duration_ns < BILLION ) {
    out << duration_ns / MILLION << " ms";
  } else {
    out << duration_ns / BILLION << " s";
  }

  return out.str();
}
