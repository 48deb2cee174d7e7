#include "static.hh"

#include <algorithm>
#include <iterator>

using namespace std;
using namespace fanout;

StaticPoolDistributor::StaticPoolDistributor( vector<vector<Batch>>&& groups )
{
  groups_.reserve( groups.size() );

  for ( auto& group : groups ) {
    groups_.emplace_back( make_move_iterator( group.begin() ),
                          make_move_iterator( group.end() ) );
  }
}

optional<Batch> StaticPoolDistributor::next_for( const SlotId slot )
{
  if ( not has_work_for( slot ) ) {
    return nullopt;
  }

  Batch batch = move( groups_[slot].front() );
  groups_[slot].pop_front();
  return batch;
}

bool StaticPoolDistributor::has_work_for( const SlotId slot ) const
{
  return slot < groups_.size() and not groups_[slot].empty();
}

bool StaticPoolDistributor::exhausted() const
{
  return all_of( groups_.begin(), groups_.end(), []( const auto& g ) {
    return g.empty();
  } );
}

vector<Batch> StaticPoolDistributor::drop_pending()
{
  vector<Batch> dropped;

  for ( SlotId slot = 0; slot < groups_.size(); slot++ ) {
    auto released = release_slot( slot );
    move( released.begin(), released.end(), back_inserter( dropped ) );
  }

  return dropped;
}

vector<Batch> StaticPoolDistributor::release_slot( const SlotId slot )
{
  vector<Batch> released;

  if ( slot >= groups_.size() ) {
    return released;
  }

  released.assign( make_move_iterator( groups_[slot].begin() ),
                   make_move_iterator( groups_[slot].end() ) );
  groups_[slot].clear();
  return released;
}
