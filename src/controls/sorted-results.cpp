# include "../../controls/sorted-results.hpp"
# include "../value-tools.hpp"
# include <mtc/wcsstr.h>
# include <ldap.h>

namespace arbor {
namespace controls {

  const char sortedResultsOid[] = "1.2.840.113556.1.4.473";

  static  const char sortKeysOption[] = "sort-keys";

  class SortedResults final: public IControl
  {
    implement_lifetime_control

  public:
    SortedResults( bool crit ):
      critical( crit ) {}

    auto  GetOid() const -> std::string override  {  return sortedResultsOid;  }
    auto  GetClientControls( const mtc::zmap& ) const -> std::vector<Control> override  {  return {};  }
    auto  GetServerControls( const mtc::zmap& ) const -> std::vector<Control> override;

  protected:
    const bool  critical;

  };

  auto  SortedResults::GetServerControls( const mtc::zmap& options ) const -> std::vector<Control>
  {
    auto  pkeys = options.get( sortKeysOption );
    auto  skeys = std::vector<SortKey>();

    if ( pkeys == nullptr )
      return {};

    for ( auto& next: GetStrings( *pkeys ) )
      skeys.push_back( ParseSortKey( next ) );

    if ( skeys.empty() )
      return {};

    return { { sortedResultsOid, EncodeSortKeys( skeys ), critical } };
  }

  auto  CreateSortedResults( bool critical ) -> mtc::api<const IControl>
  {
    return new SortedResults( critical );
  }

  auto  ParseSortKey( const std::string& str ) -> SortKey
  {
    auto          keyStr = str;
    LDAPSortKey** keySet = nullptr;
    auto          sortKey = SortKey();

    if ( ldap_create_sort_keylist( &keySet, &keyStr[0] ) != LDAP_SUCCESS )
      throw std::invalid_argument( mtc::strprintf( "invalid sort key '%s'", str.c_str() ) );

    if ( keySet[0] == nullptr || keySet[1] != nullptr )
    {
      ldap_free_sort_keylist( keySet );
      throw std::invalid_argument( mtc::strprintf( "single sort key expected, '%s' found", str.c_str() ) );
    }

    sortKey.attr = keySet[0]->attributeType;
    sortKey.orderingRule = keySet[0]->orderingRule != nullptr ? keySet[0]->orderingRule : "";
    sortKey.reverse = keySet[0]->reverseOrder != 0;

    ldap_free_sort_keylist( keySet );
    return sortKey;
  }

  auto  OrderBy( const queries::Branchset& branchset, const std::vector<std::string>& keys ) -> queries::Branchset
  {
    auto  pkeys = branchset.GetOptions().get( sortKeysOption );
    auto  order = pkeys != nullptr ? GetStrings( *pkeys ) : std::vector<std::string>();

    if ( branchset.GetDirectory().GetControl( sortedResultsOid ) == nullptr )
      throw std::invalid_argument( "sorted results control is not registered with the directory" );

    for ( auto& next: keys )
    {
      ParseSortKey( next );
      order.push_back( next );
    }

    return branchset.With( sortKeysOption, mtc::zval( mtc::array_charstr( order.begin(), order.end() ) ) );
  }

 /*
  * EncodeSortKeys( keys )
  *
  * SortKeyList ::= SEQUENCE OF SEQUENCE {
  *   attributeType   AttributeDescription,
  *   orderingRule    [0] MatchingRuleId OPTIONAL,
  *   reverseOrder    [1] BOOLEAN DEFAULT FALSE }
  *
  * libldap needs the session handle for the encoder options only; the
  * handle is initialized without connecting anywhere.
  */
  auto  EncodeSortKeys( const std::vector<SortKey>& keys ) -> std::string
  {
    auto    keyset = std::vector<LDAPSortKey>( keys.size() );
    auto    keyptr = std::vector<LDAPSortKey*>();
    LDAP*   ldhandle = nullptr;
    berval  encoded = { 0, nullptr };
    int     nerror;

    for ( size_t i = 0; i != keys.size(); ++i )
    {
      keyset[i].attributeType = const_cast<char*>( keys[i].attr.c_str() );
      keyset[i].orderingRule = keys[i].orderingRule.empty() ? nullptr : const_cast<char*>( keys[i].orderingRule.c_str() );
      keyset[i].reverseOrder = keys[i].reverse ? 1 : 0;

      keyptr.push_back( &keyset[i] );
    }
    keyptr.push_back( nullptr );

    if ( (nerror = ldap_initialize( &ldhandle, nullptr )) != LDAP_SUCCESS )
      throw std::runtime_error( mtc::strprintf( "could not create LDAP handle: %s", ldap_err2string( nerror ) ) );

    nerror = ldap_create_sort_control_value( ldhandle, keyptr.data(), &encoded );
    ldap_unbind_ext_s( ldhandle, nullptr, nullptr );

    if ( nerror != LDAP_SUCCESS )
      throw std::invalid_argument( mtc::strprintf( "could not encode sort keys: %s", ldap_err2string( nerror ) ) );

    auto  output = std::string( encoded.bv_val, encoded.bv_len );

    ldap_memfree( encoded.bv_val );
    return output;
  }

}}
