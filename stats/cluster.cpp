
//    --------------------------------------------------------------------
//
//    This file is part of ephys.
//
//    ephys is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    ephys is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with ephys. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "stats/cluster.h"

#include "helper/helper.h"

#include <cmath>
#include <algorithm>


adjacency_t grid_adjacency( const std::vector<int> & shape ,
			    int chan_axis ,
			    const adjacency_t * chan_adj )
{

  const int nd = shape.size();

  if ( nd == 0 ) Helper::halt( "empty feature shape" );

  if ( chan_adj != NULL && ( chan_axis < 0 || chan_axis >= nd ) )
    Helper::halt( "channel adjacency axis " + Helper::int2str( chan_axis ) + " out of range" );

  // row-major strides
  std::vector<int> stride( nd , 1 );
  for (int a=nd-2; a>=0; a--) stride[a] = stride[a+1] * shape[a+1];

  const int n = stride[0] * shape[0];

  adjacency_t adj;

  for (int i=0; i<n; i++)
    {
      std::set<int> & nb = adj[i];

      for (int a=0; a<nd; a++)
	{
	  const int c = ( i / stride[a] ) % shape[a];

	  if ( chan_adj != NULL && a == chan_axis )
	    {
	      adjacency_t::const_iterator cc = chan_adj->find( c );
	      if ( cc == chan_adj->end() ) continue;
	      std::set<int>::const_iterator jj = cc->second.begin();
	      while ( jj != cc->second.end() )
		{
		  if ( *jj < 0 || *jj >= shape[a] )
		    Helper::halt( "channel adjacency refers to channel " + Helper::int2str( *jj ) + " out of range" );
		  if ( *jj != c ) nb.insert( i + ( *jj - c ) * stride[a] );
		  ++jj;
		}
	    }
	  else
	    {
	      if ( c > 0 ) nb.insert( i - stride[a] );
	      if ( c < shape[a] - 1 ) nb.insert( i + stride[a] );
	    }
	}
    }

  return adj;
}


struct cluster_sorter_t {

  cluster_sorter_t( double stat , int v ) : stat(stat) , v(v) { }

  double stat;
  int v;

  bool operator< ( const cluster_sorter_t & rhs ) const
  {
    if ( stat > rhs.stat ) return true;
    if ( stat < rhs.stat ) return false;
    return v < rhs.v;
  }
};


clusters_t::clusters_t( const Eigen::VectorXd & T ,
			double threshold ,
			const adjacency_t & adj )
{

  max_mass = 0;

  const int n = T.size();

  label.resize( n , -1 );

  // candidate seeds, by decreasing |T|
  std::set<cluster_sorter_t> o;
  for (int i=0; i<n; i++)
    if ( fabs( T[i] ) > threshold )
      o.insert( cluster_sorter_t( fabs( T[i] ) , i ) );

  std::set<int> clustered;

  std::set<cluster_sorter_t>::const_iterator oo = o.begin();
  while ( oo != o.end() )
    {

      if ( clustered.count( oo->v ) ) { ++oo; continue; }

      cluster_t cluster;
      cluster.seed = oo->v;
      cluster.mass = T[ cluster.seed ];
      cluster.p = 1;
      cluster.members.insert( cluster.seed );
      clustered.insert( cluster.seed );

      const bool positive = T[ cluster.seed ] > 0;

      // add friends, then friends of friends
      std::set<int> friends;
      adjacency_t::const_iterator aa = adj.find( cluster.seed );
      if ( aa != adj.end() ) friends = aa->second;

      while ( friends.size() )
	{
	  std::set<int> newfriends;

	  std::set<int>::const_iterator ff = friends.begin();
	  while ( ff != friends.end() )
	    {
	      const int f = *ff;
	      ++ff;

	      if ( clustered.count( f ) ) continue;
	      if ( fabs( T[f] ) <= threshold ) continue;
	      if ( ( T[f] > 0 ) != positive ) continue;

	      cluster.members.insert( f );
	      cluster.mass += T[f];
	      clustered.insert( f );

	      adjacency_t::const_iterator nn = adj.find( f );
	      if ( nn == adj.end() ) continue;
	      std::set<int>::const_iterator jj = nn->second.begin();
	      while ( jj != nn->second.end() )
		{
		  if ( ! clustered.count( *jj ) ) newfriends.insert( *jj );
		  ++jj;
		}
	    }

	  friends = newfriends;
	}

      clusters.push_back( cluster );

      ++oo;
    }

  std::sort( clusters.begin() , clusters.end() );

  for (int c=0; c<clusters.size(); c++)
    {
      std::set<int>::const_iterator mm = clusters[c].members.begin();
      while ( mm != clusters[c].members.end() )
	{
	  label[ *mm ] = c;
	  ++mm;
	}
      if ( fabs( clusters[c].mass ) > max_mass ) max_mass = fabs( clusters[c].mass );
    }

}
