
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

#include "dataset/dataset.h"

#include "helper/helper.h"

#include <cmath>


//
// epochs_t
//

void epochs_t::init_log()
{
  const int n = trials.size();
  drop_log.assign( n , "" );
  selection.resize( n );
  for (int i=0; i<n; i++) selection[i] = i;
  if ( events.size() == 0 ) events.assign( n , 0 );
  if ( events.size() != n ) Helper::halt( "epochs: event codes do not match number of trials" );
}

int epochs_t::drop( const std::vector<bool> & mask , const std::string & reason )
{
  if ( mask.size() != trials.size() )
    Helper::halt( "epochs: drop mask has " + Helper::int2str( (int)mask.size() )
		  + " entries but there are " + Helper::int2str( size() ) + " trials" );

  if ( selection.size() != trials.size() ) init_log();

  std::vector<Eigen::MatrixXd> t2;
  std::vector<int> e2 , s2;
  int dropped = 0;

  for (int i=0; i<mask.size(); i++)
    {
      if ( mask[i] )
	{
	  drop_log[ selection[i] ] = reason;
	  ++dropped;
	  continue;
	}
      t2.push_back( trials[i] );
      e2.push_back( events[i] );
      s2.push_back( selection[i] );
    }

  trials = t2;
  events = e2;
  selection = s2;
  return dropped;
}

Eigen::MatrixXd epochs_t::trial( int e , const std::vector<int> & picks , bool diff ) const
{
  const Eigen::MatrixXd & X = trials[e];
  const int nt = X.cols();
  const int nt2 = diff ? ( nt > 0 ? nt - 1 : 0 ) : nt ;

  Eigen::MatrixXd R( picks.size() , nt2 );
  for (int c=0; c<picks.size(); c++)
    for (int t=0; t<nt2; t++)
      R(c,t) = diff ? X( picks[c] , t+1 ) - X( picks[c] , t ) : X( picks[c] , t ) ;
  return R;
}


//
// dataset_t
//

int dataset_t::channel( const std::string & label ) const
{
  for (int c=0; c<channels.size(); c++)
    if ( channels[c].label == label ) return c;
  return -1;
}

bool dataset_t::is_bad( const std::string & label ) const
{
  for (int i=0; i<bads.size(); i++)
    if ( bads[i] == label ) return true;
  return false;
}

bool dataset_t::add_bad( const std::string & label )
{
  if ( is_bad( label ) ) return false;
  bads.push_back( label );
  return true;
}

std::vector<int> dataset_t::picks( pick_t p , ref_meg_t ref , bool exclude_bads ) const
{

  // reference sensors join MEG selections only
  const bool meg_pick = p == PICK_MAG || p == PICK_GRAD || p == PICK_MEG ;
  const bool with_ref = meg_pick && ( ref == REF_MEG_YES || ( ref == REF_MEG_AUTO && compensated ) );

  std::vector<int> r;

  for (int c=0; c<channels.size(); c++)
    {

      const channel_type_t t = channels[c].type;

      bool match = false;
      switch ( p )
	{
	case PICK_MAG  : match = t == MAG; break;
	case PICK_GRAD : match = t == GRAD; break;
	case PICK_MEG  : match = t == MAG || t == GRAD; break;
	case PICK_EEG  : match = t == EEG; break;
	case PICK_EOG  : match = t == EOG; break;
	case PICK_ECG  : match = t == ECG; break;
	case PICK_EMG  : match = t == EMG; break;
	case PICK_MISC : match = t == MISC; break;
	}

      if ( with_ref && t == REF_MEG ) match = true;

      if ( ! match ) continue;

      if ( exclude_bads && is_bad( channels[c].label ) ) continue;

      r.push_back( c );
    }

  return r;
}

std::vector<bool> dataset_t::bad_annotated_samples() const
{

  const int ns = nsamples();
  std::vector<bool> b( ns , false );

  // half a sample of slack on both edges
  const double eps = 0.5 / sfreq;

  for (int a=0; a<annotations.size(); a++)
    {
      const annotation_t & annot = annotations[a];
      if ( ! annot.is_bad() ) continue;

      // annotation times are relative to start of acquisition
      const double start = annot.onset - first_time();
      const double stop = annot.offset() - first_time();

      int s0 = (int)ceil( ( start - eps ) * sfreq );
      int s1 = (int)floor( ( stop + eps ) * sfreq );
      if ( s0 < 0 ) s0 = 0;
      if ( s1 > ns - 1 ) s1 = ns - 1;
      for (int s=s0; s<=s1; s++) b[s] = true;
    }

  return b;
}

Eigen::MatrixXd dataset_t::get_data( const std::vector<int> & rows , const std::vector<bool> & keep ) const
{

  const int ns = nsamples();

  if ( keep.size() != 0 && keep.size() != ns )
    Helper::halt( "sample mask does not match the number of samples" );

  std::vector<int> cols;
  for (int s=0; s<ns; s++)
    if ( keep.size() == 0 || keep[s] ) cols.push_back( s );

  Eigen::MatrixXd R( rows.size() , cols.size() );
  for (int r=0; r<rows.size(); r++)
    {
      if ( rows[r] < 0 || rows[r] >= data.rows() )
	Helper::halt( "channel index out of range" );
      for (int s=0; s<cols.size(); s++)
	R(r,s) = data( rows[r] , cols[s] );
    }
  return R;
}
