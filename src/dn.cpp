# include "../dn.hpp"
# include <mtc/wcsstr.h>
# include <ldap.h>
# include <algorithm>
# include <cctype>

namespace arbor {
namespace dn {

 /*
  * ParsedDn
  *
  * Owns the ldap_str2dn() output. DNs are accepted in the tolerant form:
  * spaces around separators and quoted values are allowed.
  */
  class ParsedDn
  {
    LDAPDN  ldapdn = nullptr;

  public:
    ParsedDn( const std::string_view& str )
    {
      auto  source = std::string( str );
      int   nerror;

      if ( (nerror = ldap_str2dn( source.c_str(), &ldapdn, LDAP_DN_FORMAT_LDAP )) != LDAP_SUCCESS )
      {
        throw InvalidDN( mtc::strprintf( "invalid DN '%s': %s", source.c_str(),
          ldap_err2string( nerror ) ) );
      }
    }
   ~ParsedDn()
    {
      ldap_dnfree( ldapdn );
    }
    ParsedDn( const ParsedDn& ) = delete;
    ParsedDn& operator = ( const ParsedDn& ) = delete;

    auto  size() const -> size_t
    {
      size_t  length = 0;

      if ( ldapdn != nullptr )
        while ( ldapdn[length] != nullptr )
          ++length;
      return length;
    }
    auto  operator []( size_t i ) const -> LDAPRDN {  return ldapdn[i];  }
    auto  get() const -> LDAPDN {  return ldapdn;  }

  };

  static  bool  IsBlank( const std::string_view& str )
  {
    return std::all_of( str.begin(), str.end(), []( char c ){  return isspace( (unsigned char)c ) != 0;  } );
  }

  static  auto  ToString( const struct berval& bv ) -> std::string
  {
    return bv.bv_val != nullptr ? std::string( bv.bv_val, bv.bv_len ) : std::string();
  }

  static  auto  RdnToString( LDAPRDN rdn ) -> std::string
  {
    char* output = nullptr;
    int   nerror;

    if ( (nerror = ldap_rdn2str( rdn, &output, LDAP_DN_FORMAT_LDAPV3 )) != LDAP_SUCCESS )
      throw InvalidDN( mtc::strprintf( "could not build RDN: %s", ldap_err2string( nerror ) ) );

    auto  rdnstr = std::string( output );

    ldap_memfree( output );
    return rdnstr;
  }

  auto  SplitDn( const std::string_view& str, unsigned limit ) -> std::vector<std::string>
  {
    auto  output = std::vector<std::string>();

    if ( IsBlank( str ) )
      return output;

    auto  parsed = ParsedDn( str );

    for ( size_t i = 0; i != parsed.size(); ++i )
    {
      if ( limit != 0 && output.size() == limit )
        output.back() += ',' + RdnToString( parsed[i] );
      else
        output.push_back( RdnToString( parsed[i] ) );
    }
    return output;
  }

  auto  ParseRdn( const std::string_view& str ) -> RDN
  {
    auto  rdnset = ParseDn( str );

    if ( rdnset.size() != 1 )
      throw InvalidDN( mtc::strprintf( "single RDN expected, '%s' found", std::string( str ).c_str() ) );

    return std::move( rdnset.front() );
  }

  auto  ParseDn( const std::string_view& str ) -> std::vector<RDN>
  {
    auto  output = std::vector<RDN>();

    if ( IsBlank( str ) )
      return output;

    auto  parsed = ParsedDn( str );

    for ( size_t i = 0; i != parsed.size(); ++i )
    {
      auto& rdnset = output.emplace_back();

      for ( auto ava = parsed[i]; *ava != nullptr; ++ava )
        rdnset.push_back( { ToString( (*ava)->la_attr ), ToString( (*ava)->la_value ) } );
    }
    return output;
  }

  bool  IsValid( const std::string_view& str ) noexcept
  {
    try
    {
      return !ParseDn( str ).empty();
    }
    catch ( const InvalidDN& )
    {
      return false;
    }
  }

  auto  MakeRdn( const RDN& rdn ) -> std::string
  {
    auto  avaset = std::vector<LDAPAVA>( rdn.size() );
    auto  rdnptr = std::vector<LDAPAVA*>();

    if ( rdn.empty() )
      throw InvalidDN( "RDN has to have at least one attribute=value pair" );

    for ( size_t i = 0; i != rdn.size(); ++i )
    {
      avaset[i].la_attr.bv_val = const_cast<char*>( rdn[i].attr.c_str() );
      avaset[i].la_attr.bv_len = rdn[i].attr.size();
      avaset[i].la_value.bv_val = const_cast<char*>( rdn[i].value.c_str() );
      avaset[i].la_value.bv_len = rdn[i].value.size();
      avaset[i].la_flags = LDAP_AVA_STRING;
      avaset[i].la_private = nullptr;

      rdnptr.push_back( &avaset[i] );
    }
    rdnptr.push_back( nullptr );

    return RdnToString( rdnptr.data() );
  }

  auto  MakeRdn( const std::string_view& attr, const std::string_view& value ) -> std::string
  {
    return MakeRdn( RDN{ { std::string( attr ), std::string( value ) } } );
  }

  auto  Normalize( const std::string_view& str ) -> std::string
  {
    char* output = nullptr;
    int   nerror;

    if ( IsBlank( str ) )
      return {};

    auto  parsed = ParsedDn( str );

    if ( (nerror = ldap_dn2str( parsed.get(), &output, LDAP_DN_FORMAT_LDAPV3 )) != LDAP_SUCCESS )
      throw InvalidDN( mtc::strprintf( "could not normalize DN '%s': %s", std::string( str ).c_str(),
        ldap_err2string( nerror ) ) );

    auto  normal = std::string( output != nullptr ? output : "" );

    ldap_memfree( output );
    return normal;
  }

  auto  GetParent( const std::string_view& str ) -> std::string
  {
    auto  splits = SplitDn( str, 2 );

    return splits.size() == 2 ? splits.back() : std::string();
  }

  static  auto  LowerCase( std::string str ) -> std::string
  {
    for ( auto& chr: str )
      chr = (char)tolower( (unsigned char)chr );
    return str;
  }

  static  auto  Components( const std::string_view& str ) -> std::vector<std::string>
  {
    auto  output = std::vector<std::string>();

    for ( auto& next: SplitDn( str ) )
      output.push_back( LowerCase( next ) );

    return output;
  }

  bool  IsAncestorOrSelf( const std::string_view& base, const std::string_view& str )
  {
    auto  bparts = Components( base );
    auto  dparts = Components( str );

    return bparts.size() <= dparts.size()
      && std::equal( bparts.rbegin(), bparts.rend(), dparts.rbegin() );
  }

  int   Compare( const std::string_view& lhs, const std::string_view& rhs )
  {
    auto  lparts = Components( lhs );
    auto  rparts = Components( rhs );

    for ( auto l = lparts.rbegin(), r = rparts.rbegin(); l != lparts.rend() && r != rparts.rend(); ++l, ++r )
    {
      auto  rescmp = l->compare( *r );

      if ( rescmp != 0 )
        return rescmp < 0 ? -1 : 1;
    }
    return lparts.size() < rparts.size() ? -1 : lparts.size() > rparts.size() ? 1 : 0;
  }

}}
