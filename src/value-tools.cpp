# include "value-tools.hpp"
# include "../compat.hpp"
# include <moonycode/codes.h>
# include <stdexcept>
# include <cctype>

namespace arbor {

  auto  ToString( const mtc::zval& z ) -> std::string
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_charstr:  return *z.get_charstr();
      case mtc::zval::z_widestr:  return codepages::widetombcs( codepages::codepage_utf8, *z.get_widestr() );
      case mtc::zval::z_char:     return std::to_string( *z.get_char() );
      case mtc::zval::z_byte:     return std::to_string( *z.get_byte() );
      case mtc::zval::z_int16:    return std::to_string( *z.get_int16() );
      case mtc::zval::z_int32:    return std::to_string( *z.get_int32() );
      case mtc::zval::z_int64:    return std::to_string( *z.get_int64() );
      case mtc::zval::z_word16:   return std::to_string( *z.get_word16() );
      case mtc::zval::z_word32:   return std::to_string( *z.get_word32() );
      case mtc::zval::z_word64:   return std::to_string( *z.get_word64() );
      case mtc::zval::z_float:
      case mtc::zval::z_double:   return mtc::to_string( z );
      default:
        throw std::invalid_argument( "scalar value expected" );
    }
  }

  auto  GetStrings( const mtc::zval& z ) -> std::vector<std::string>
  {
    switch ( z.get_type() )
    {
      case mtc::zval::z_array_charstr:
        return *z.get_array_charstr();
      case mtc::zval::z_array_zval:
      {
        auto  output = std::vector<std::string>();

        for ( auto& next: *z.get_array_zval() )
          output.push_back( ToString( next ) );
        return output;
      }
      default:
        return { ToString( z ) };
    }
  }

  auto  LowerCase( const std::string_view& str ) -> std::string
  {
    auto  out = std::string( str );

    for ( auto& c: out )
      c = char(tolower( (unsigned char)c ));
    return out;
  }

  bool  EqualNoCase( const std::string_view& a, const std::string_view& b ) noexcept
  {
    return a.size() == b.size() && strncasecmp( a.data(), b.data(), a.size() ) == 0;
  }

  auto  FindAttribute( const mtc::zmap& entry, const std::string_view& name ) -> const mtc::zval*
  {
    for ( auto& next: entry )
      if ( next.first.is_charstr() && EqualNoCase( next.first.to_charstr(), name ) )
        return &next.second;
    return nullptr;
  }

  auto  GetAttribute( const mtc::zmap& entry, const std::string_view& name ) -> std::vector<std::string>
  {
    auto  pvalue = FindAttribute( entry, name );

    return pvalue != nullptr ? GetStrings( *pvalue ) : std::vector<std::string>();
  }

  void  SetAttribute( mtc::zmap& entry, const std::string_view& name, const std::vector<std::string>& values )
  {
    DelAttribute( entry, name );

    if ( !values.empty() )
      entry.set_array_charstr( std::string( name ).c_str(), values );
  }

  void  DelAttribute( mtc::zmap& entry, const std::string_view& name )
  {
    auto  found = std::string();

    for ( auto& next: entry )
      if ( next.first.is_charstr() && EqualNoCase( next.first.to_charstr(), name ) )
        {  found = next.first.to_charstr();  break;  }

    if ( !found.empty() )
      entry.erase( found.c_str() );
  }

}
