
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( (unsigned char)s[i] );
  return j;
}

std::string Helper::tolower( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::tolower( (unsigned char)s[i] );
  return j;
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else (including empty, i.e. 'var' --> 'var=T')
  if ( s.size() == 0 ) return false;
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::iequals( const std::string& a, const std::string& b )
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (std::tolower(a[i]) != std::tolower(b[i]))
      return false;
  return true;
}

bool Helper::istarts_with( const std::string & a , const std::string & prefix )
{
  if ( prefix.size() > a.size() ) return false;
  return iequals( a.substr( 0 , prefix.size() ) , prefix );
}

std::string Helper::swap_extension( const std::string & f , const std::string & ext )
{
  const std::size_t p = f.rfind( '.' );
  const std::size_t s = f.find_last_of( "/\\" );
  // no extension, or dot is in a folder name
  if ( p == std::string::npos || ( s != std::string::npos && p < s ) )
    return f + ext;
  return f.substr( 0 , p ) + ext;
}

bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }
  return false;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv( "HOME" );
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}


// handles LF, CR and CRLF line endings

std::istream& Helper::safe_getline( std::istream& is, std::string& t )
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {
      int c = sb->sbumpc();
      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

	case EOF :
	  // last line may have no line ending
	  if(t.empty())
	    is.setstate(std::ios::eofbit);
	  return is;

	default:
	  t += (char)c;
	}
    }
}


void Helper::halt( const std::string & msg )
{

  // some other code handles the error, e.g. an embedding application
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // otherwise, unwind to the caller (the command-line tool reports and exits)
  throw ephys_error( msg );
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

std::string Helper::int2str( int n )
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str( long n )
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str( double n )
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str( double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

bool Helper::str2dbl( const std::string & s , double * d )
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int( const std::string & s , int * i )
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::str2dbl_na( const std::string & s , double * d )
{
  if ( s == "." || iequals( s , "NA" ) || iequals( s , "NaN" ) )
    {
      *d = std::numeric_limits<double>::quiet_NaN();
      return true;
    }
  return str2dbl( s , d );
}

std::vector<std::string> Helper::parse( const std::string & item, const std::string & s , bool empty )
{
  return Helper::char_split( item , s , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const std::string & delims , bool empty )
{

  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( delims.find( s[j] ) != std::string::npos )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}
