
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

#include "defs/defs.h"
#include "helper/helper.h"

#include <sstream>

std::string globals::version;
std::string globals::date;

bool globals::silent;
bool globals::api_mode;
bool globals::cache_log;

void (*globals::bail_function) ( const std::string & );
void (*globals::logger_function) ( const std::string & );

std::map<std::string,pick_t> globals::pick_kw;
std::map<std::string,metric_t> globals::metric_kw;
std::map<std::string,detect_mode_t> globals::detect_kw;
std::map<std::string,scan_mode_t> globals::scan_kw;
std::map<std::string,ret_mode_t> globals::ret_kw;
std::map<std::string,ref_meg_t> globals::ref_meg_kw;
std::map<std::string,regressor_type_t> globals::regressor_kw;
std::map<std::string,perm_method_t> globals::perm_method_kw;
std::map<std::string,perm_scheme_t> globals::perm_scheme_kw;
std::map<std::string,channel_type_t> globals::channel_kw;


void globals::api()
{
  api_mode = true;
  silent = true;
}

void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.4.1";

  date    = "02-Oct-2026";

  //
  // Logging / error handling
  //

  silent = false;
  api_mode = false;
  cache_log = false;
  bail_function = NULL;
  logger_function = NULL;


  //
  // Keywords (all matched case-insensitively)
  //

  pick_kw.clear();
  pick_kw[ "mag" ]  = PICK_MAG;
  pick_kw[ "grad" ] = PICK_GRAD;
  pick_kw[ "meg" ]  = PICK_MEG;
  pick_kw[ "eeg" ]  = PICK_EEG;
  pick_kw[ "eog" ]  = PICK_EOG;
  pick_kw[ "ecg" ]  = PICK_ECG;
  pick_kw[ "emg" ]  = PICK_EMG;
  pick_kw[ "misc" ] = PICK_MISC;

  metric_kw.clear();
  metric_kw[ "std" ] = METRIC_STD;
  metric_kw[ "var" ] = METRIC_VAR;
  metric_kw[ "kurtosis" ] = METRIC_KURTOSIS;

  detect_kw.clear();
  detect_kw[ "none" ] = DETECT_NONE;
  detect_kw[ "diff" ] = DETECT_DIFF;
  detect_kw[ "maxfilter" ] = DETECT_MAXFILTER;

  scan_kw.clear();
  scan_kw[ "dim" ] = SCAN_DIM;
  scan_kw[ "segments" ] = SCAN_SEGMENTS;

  ret_kw.clear();
  ret_kw[ "bad_inds" ] = RET_BAD_INDS;
  ret_kw[ "good_inds" ] = RET_GOOD_INDS;
  ret_kw[ "zero_bads" ] = RET_ZERO_BADS;
  ret_kw[ "nan_bads" ] = RET_NAN_BADS;

  ref_meg_kw.clear();
  ref_meg_kw[ "auto" ] = REF_MEG_AUTO;
  ref_meg_kw[ "yes" ]  = REF_MEG_YES;
  ref_meg_kw[ "no" ]   = REF_MEG_NO;

  regressor_kw.clear();
  regressor_kw[ "constant" ] = REG_CONSTANT;
  regressor_kw[ "parametric" ] = REG_PARAMETRIC;
  regressor_kw[ "categorical" ] = REG_CATEGORICAL;
  regressor_kw[ "meaneffects" ] = REG_MEAN_EFFECTS;

  perm_method_kw.clear();
  perm_method_kw[ "max" ] = PERM_MAXSTAT;
  perm_method_kw[ "cluster" ] = PERM_CLUSTER;

  perm_scheme_kw.clear();
  perm_scheme_kw[ "auto" ] = PERM_AUTO;
  perm_scheme_kw[ "row-shuffle" ] = PERM_ROW_SHUFFLE;
  perm_scheme_kw[ "sign-flip" ] = PERM_SIGN_FLIP;

  channel_kw.clear();
  channel_kw[ "mag" ]     = MAG;
  channel_kw[ "grad" ]    = GRAD;
  channel_kw[ "ref_meg" ] = REF_MEG;
  channel_kw[ "eeg" ]     = EEG;
  channel_kw[ "eog" ]     = EOG;
  channel_kw[ "ecg" ]     = ECG;
  channel_kw[ "emg" ]     = EMG;
  channel_kw[ "misc" ]    = MISC;
  channel_kw[ "stim" ]    = STIM;

}


template<typename T>
T globals::lookup( const std::map<std::string,T> & kw , const std::string & s , const std::string & what )
{
  typename std::map<std::string,T>::const_iterator ii = kw.find( Helper::tolower( s ) );
  if ( ii != kw.end() ) return ii->second;

  std::stringstream ss;
  ss << "unrecognized " << what << " '" << s << "', expecting one of:";
  ii = kw.begin();
  while ( ii != kw.end() )
    {
      ss << " " << ii->first;
      ++ii;
    }
  Helper::halt( ss.str() );
  return kw.begin()->second;
}

template<typename T>
std::string globals::rlookup( const std::map<std::string,T> & kw , T t )
{
  typename std::map<std::string,T>::const_iterator ii = kw.begin();
  while ( ii != kw.end() )
    {
      if ( ii->second == t ) return ii->first;
      ++ii;
    }
  return "?";
}


pick_t globals::pick( const std::string & s ) { return lookup( pick_kw , s , "picks" ); }
std::string globals::pick( pick_t p ) { return rlookup( pick_kw , p ); }

metric_t globals::metric( const std::string & s ) { return lookup( metric_kw , s , "metric" ); }
std::string globals::metric( metric_t m ) { return rlookup( metric_kw , m ); }

detect_mode_t globals::detect_mode( const std::string & s ) { return lookup( detect_kw , s , "mode" ); }
std::string globals::detect_mode( detect_mode_t m ) { return rlookup( detect_kw , m ); }

scan_mode_t globals::scan_mode( const std::string & s ) { return lookup( scan_kw , s , "scan mode" ); }

ret_mode_t globals::ret_mode( const std::string & s ) { return lookup( ret_kw , s , "ret_mode" ); }

ref_meg_t globals::ref_meg( const std::string & s ) { return lookup( ref_meg_kw , s , "ref_meg" ); }

regressor_type_t globals::regressor_type( const std::string & s ) { return lookup( regressor_kw , s , "regressor type" ); }
std::string globals::regressor_type( regressor_type_t t ) { return rlookup( regressor_kw , t ); }

perm_method_t globals::perm_method( const std::string & s ) { return lookup( perm_method_kw , s , "permutation method" ); }
std::string globals::perm_method( perm_method_t m ) { return rlookup( perm_method_kw , m ); }

perm_scheme_t globals::perm_scheme( const std::string & s ) { return lookup( perm_scheme_kw , s , "permutation scheme" ); }
std::string globals::perm_scheme( perm_scheme_t s ) { return rlookup( perm_scheme_kw , s ); }

channel_type_t globals::channel_type( const std::string & s ) { return lookup( channel_kw , s , "channel type" ); }
std::string globals::channel_type( channel_type_t t ) { return rlookup( channel_kw , t ); }
