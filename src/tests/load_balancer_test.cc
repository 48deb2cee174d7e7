#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

#include "schedulers/load_balancer.hh"

using namespace std;
using namespace fanout;

namespace {

vector<Task> make_tasks( const vector<optional<double>>& costs )
{
  vector<Task> tasks;
  for ( size_t i = 0; i < costs.size(); i++ ) {
    tasks.push_back( { i, "t" + std::to_string( i ), costs[i] } );
  }
  return tasks;
}

vector<TaskId> ids( const vector<Task>& tasks )
{
  vector<TaskId> result;
  for ( const auto& t : tasks ) {
    result.push_back( t.id );
  }
  return result;
}

double group_cost( const vector<Task>& group )
{
  return total_cost( group );
}

}

TEST( LoadBalancer, NonePreservesOrder )
{
  const LoadBalancer balancer { BalancerPolicy::none() };
  const auto ordered = balancer.order( make_tasks( { 3.0, 1.0, 2.0, nullopt } ) );
  EXPECT_EQ( ( vector<TaskId> { 0, 1, 2, 3 } ), ids( ordered ) );
}

TEST( LoadBalancer, RandomizeIsDeterministicPerSeed )
{
  const vector<optional<double>> costs( 50, 1.0 );

  const LoadBalancer a { BalancerPolicy::randomize( 42 ) };
  const LoadBalancer b { BalancerPolicy::randomize( 42 ) };
  const LoadBalancer c { BalancerPolicy::randomize( 43 ) };

  const auto first = ids( a.order( make_tasks( costs ) ) );
  const auto second = ids( b.order( make_tasks( costs ) ) );
  const auto third = ids( c.order( make_tasks( costs ) ) );

  EXPECT_EQ( first, second );
  EXPECT_NE( first, third );

  /* still a permutation */
  EXPECT_EQ( 50u, set<TaskId>( first.begin(), first.end() ).size() );
}

TEST( LoadBalancer, SortDescendingPutsUnknownCostsLast )
{
  const LoadBalancer balancer { BalancerPolicy::sort_descending_by_cost() };
  const auto ordered
    = balancer.order( make_tasks( { 2.0, nullopt, 5.0, 2.0, nullopt, 7.0 } ) );

  EXPECT_EQ( ( vector<TaskId> { 5, 2, 0, 3, 1, 4 } ), ids( ordered ) );
}

TEST( LoadBalancer, SortDescendingWorksOnBatches )
{
  vector<Batch> batches;
  batches.push_back( { 0, make_tasks( { 1.0, 1.0 } ) } );
  batches.push_back( { 1, { { 2, "", 5.0 } } } );
  batches.push_back( { 2, { { 3, "", 3.0 } } } );

  const LoadBalancer balancer { BalancerPolicy::sort_descending_by_cost() };
  const auto ordered = balancer.order( move( batches ) );

  ASSERT_EQ( 3u, ordered.size() );
  EXPECT_EQ( 1u, ordered[0].id );
  EXPECT_EQ( 2u, ordered[1].id );
  EXPECT_EQ( 0u, ordered[2].id );
}

TEST( LoadBalancer, PartitionIsolatesExpensiveTask )
{
  const vector<optional<double>> costs { 1, 1, 1, 1, 1, 1, 1, 1, 100, 1 };

  /* naive contiguous partition of the submission order */
  const LoadBalancer naive { BalancerPolicy::none() };
  const auto naive_groups = naive.partition( make_tasks( costs ), 4 );
  double naive_max = 0;
  for ( const auto& g : naive_groups ) {
    naive_max = max( naive_max, group_cost( g ) );
  }
  EXPECT_EQ( 101.0, naive_max );

  const LoadBalancer balancer { BalancerPolicy::sort_descending_by_cost() };
  const auto groups
    = balancer.partition( balancer.order( make_tasks( costs ) ), 4 );

  ASSERT_EQ( 4u, groups.size() );

  double balanced_max = 0;
  size_t expensive_groups = 0;
  size_t placed = 0;

  for ( const auto& g : groups ) {
    balanced_max = max( balanced_max, group_cost( g ) );
    placed += g.size();

    if ( any_of( g.begin(), g.end(), []( const Task& t ) { return t.id == 8; } ) ) {
      expensive_groups++;
      EXPECT_EQ( 1u, g.size() );
    }
  }

  EXPECT_EQ( 1u, expensive_groups );
  EXPECT_EQ( 10u, placed );
  EXPECT_LT( balanced_max, naive_max );
}

TEST( LoadBalancer, ContiguousPartitionSizes )
{
  const LoadBalancer balancer { BalancerPolicy::none() };
  const auto groups
    = balancer.partition( make_tasks( vector<optional<double>>( 10, 1.0 ) ), 4 );

  ASSERT_EQ( 4u, groups.size() );
  EXPECT_EQ( 3u, groups[0].size() );
  EXPECT_EQ( 3u, groups[1].size() );
  EXPECT_EQ( 2u, groups[2].size() );
  EXPECT_EQ( 2u, groups[3].size() );

  EXPECT_EQ( ( vector<TaskId> { 0, 1, 2 } ), ids( groups[0] ) );
  EXPECT_EQ( ( vector<TaskId> { 8, 9 } ), ids( groups[3] ) );
}

TEST( LoadBalancer, SortDescendingWithUnknownCostFallsBackToContiguous )
{
  const LoadBalancer balancer { BalancerPolicy::sort_descending_by_cost() };
  const auto groups = balancer.partition(
    balancer.order( make_tasks( { 4.0, nullopt, 3.0, 2.0, 1.0 } ) ), 2 );

  ASSERT_EQ( 2u, groups.size() );
  EXPECT_EQ( ( vector<TaskId> { 0, 2, 3 } ), ids( groups[0] ) );
  EXPECT_EQ( ( vector<TaskId> { 4, 1 } ), ids( groups[1] ) );
}

TEST( LoadBalancer, FewerUnitsThanGroups )
{
  const LoadBalancer balancer { BalancerPolicy::none() };
  const auto groups = balancer.partition( make_tasks( { 1.0, 1.0 } ), 5 );

  ASSERT_EQ( 5u, groups.size() );
  EXPECT_EQ( 1u, groups[0].size() );
  EXPECT_EQ( 1u, groups[1].size() );
  EXPECT_TRUE( groups[4].empty() );
}

TEST( LoadBalancer, ZeroGroupsIsRejected )
{
  const LoadBalancer balancer { BalancerPolicy::none() };
  EXPECT_THROW( balancer.partition( make_tasks( { 1.0 } ), 0 ), invalid_argument );
}
