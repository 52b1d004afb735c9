
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

#include "artifacts/maxfilt.h"

#include "dataset/dataset.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <cmath>

extern logger_t logger;

static const std::string buffers_phrase = " data buffers)";
static const std::string skipped_phrase = ": cont HPI is off, data block is skipped!";


bool maxfilt_log_t::parse( std::istream & in )
{

  n_dataseg = 0;
  zeroed.clear();

  bool got_duration = false;

  std::string line;
  while ( ! Helper::safe_getline( in , line ).eof() )
    {

      // e.g. "... (60 data buffers)"
      if ( ! got_duration )
	{
	  const std::size_t e = line.find( buffers_phrase );
	  if ( e != std::string::npos )
	    {
	      const std::size_t b = line.find( '(' );
	      if ( b == std::string::npos || b > e ) return false;
	      double d = 0;
	      if ( ! Helper::str2dbl( line.substr( b + 1 , e - b - 1 ) , &d ) ) return false;
	      if ( d < 1 ) return false;
	      n_dataseg = (int)d;
	      got_duration = true;
	    }
	}

      // e.g. "Time 123.456: cont HPI is off, data block is skipped!"
      const std::size_t e = line.find( skipped_phrase );
      if ( e != std::string::npos )
	{
	  const std::size_t b = line.find( "Time " );
	  if ( b == std::string::npos || b > e ) return false;
	  double t = 0;
	  if ( ! Helper::str2dbl( line.substr( b + 5 , e - b - 5 ) , &t ) ) return false;
	  zeroed.push_back( t );
	}
    }

  // skipped blocks cannot be sized without the buffer count
  if ( ! got_duration ) return false;

  return true;
}


std::vector<bool> maxfilt_log_t::bad_samples( int n_times , double first_time , double sfreq ) const
{

  std::vector<bool> bad( n_times , false );

  if ( n_dataseg < 1 ) return bad;

  // block length in samples
  const double duration = n_times / (double)n_dataseg;

  for (int i=0; i<zeroed.size(); i++)
    {
      const double start = ( zeroed[i] - first_time ) * sfreq;
      int s0 = (int)start;
      int s1 = (int)( start + duration );
      if ( s0 < 0 ) s0 = 0;
      if ( s1 > n_times ) s1 = n_times;
      for (int s=s0; s<s1; s++) bad[s] = true;
    }

  return bad;
}


std::string maxfilt_log_name( const std::string & recording )
{
  // as for the recording, but .fif --> .log
  const std::size_t p = recording.rfind( ".fif" );
  if ( p == std::string::npos ) return Helper::swap_extension( recording , ".log" );
  return recording.substr( 0 , p ) + ".log" + recording.substr( p + 4 );
}


std::vector<bool> detect_maxfilt_zeros( const dataset_t & dataset )
{

  std::vector<bool> empty;

  const std::string logfile = dataset.filename == "" ? "" : maxfilt_log_name( Helper::expand( dataset.filename ) );

  if ( logfile == "" || ! Helper::fileExists( logfile ) )
    {
      logger << "  no maxfilter logfile detected, cannot detect zeroed out data\n";
      return empty;
    }

  std::ifstream IN1( logfile.c_str() , std::ios::in );

  maxfilt_log_t mlog;

  if ( ! mlog.parse( IN1 ) )
    {
      logger.warning( "detecting zeroed out data from maxfilter log file " + logfile + " failed" );
      return empty;
    }

  logger << "  read " << mlog.zeroed.size() << " skipped data blocks (of "
	 << mlog.n_dataseg << " buffers) from " << logfile << "\n";

  return mlog.bad_samples( dataset.nsamples() , dataset.first_time() , dataset.sfreq );
}
