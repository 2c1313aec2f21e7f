# include "directory-stub.h"
# include "test-schema.h"
# include "../../src/value-tools.hpp"
# include "../../dn.hpp"
# include <mtc/wcsstr.h>
# include <algorithm>

const char testBaseDn[]     = "dc=acme,dc=com";
const char testPeopleDn[]   = "ou=people,dc=acme,dc=com";
const char testHostsDn[]    = "ou=hosts,dc=acme,dc=com";
const char testSubHostsDn[] = "ou=subhosts,ou=hosts,dc=acme,dc=com";
const char testRoomsDn[]    = "ou=rooms,dc=acme,dc=com";
const char testPersonDn[]   = "uid=hgranger,ou=people,dc=acme,dc=com";
const char testHostDn[]     = "cn=router,ou=hosts,dc=acme,dc=com";

static  const char* operationalAttrs[] = { "createTimestamp", "modifyTimestamp", "entryUUID" };

static  auto  GetKey( const std::string& dn ) -> std::string
{
  return arbor::LowerCase( arbor::dn::Normalize( dn ) );
}

DirectoryStub::DirectoryStub( const std::string& base ):
  baseDn( base )  {}

auto  DirectoryStub::AddEntry( const std::string& dn, const mtc::zmap& attrs ) -> DirectoryStub&
{
  auto  entry = attrs;

  arbor::SetAttribute( entry, "dn", { dn } );
  entries[GetKey( dn )] = std::move( entry );
  return *this;
}

auto  DirectoryStub::AddControl( mtc::api<const arbor::IControl> control ) -> DirectoryStub&
{
  controls.push_back( control );
  return *this;
}

auto  DirectoryStub::Find( const std::string& dn ) const -> const mtc::zmap*
{
  auto  pfound = entries.find( GetKey( dn ) );

  return pfound != entries.end() ? &pfound->second : nullptr;
}

auto  DirectoryStub::GetSchema() const -> mtc::zmap
{
  ++schemaLoads;
  return GetTestSchema();
}

void  DirectoryStub::Search( const std::string& base, unsigned scope, const std::string& filter,
  const arbor::SearchParams& params, const Receiver& receiver )
{
  unsigned  nfound = 0;

  searches.push_back( { base, scope, filter, params } );

  for ( auto& next: entries )
  {
    auto  entrydn = arbor::GetAttribute( next.second, "dn" ).front();
    bool  matched;

    switch ( scope )
    {
      case arbor::Scope::base:
        matched = arbor::dn::Compare( entrydn, base ) == 0;
        break;
      case arbor::Scope::onelevel:
        matched = arbor::dn::Compare( arbor::dn::GetParent( entrydn ), base ) == 0;
        break;
      case arbor::Scope::subtree:
        matched = arbor::dn::IsAncestorOrSelf( base, entrydn );
        break;
      default:
        throw std::invalid_argument( "invalid scope passed to directory" );
    }

    if ( !matched )
      continue;

    if ( params.limit != 0 && nfound >= params.limit )
      break;

    if ( params.selectattrs.empty() )
    {
      receiver( next.second );
    }
      else
    {
      auto  output = mtc::zmap();

      arbor::SetAttribute( output, "dn", { entrydn } );

      for ( auto& attr: params.selectattrs )
      {
        auto  values = arbor::GetAttribute( next.second, attr );

        if ( !values.empty() )
          arbor::SetAttribute( output, attr, values );
      }
      receiver( output );
    }
    ++nfound;
  }
}

auto  DirectoryStub::GetEntry( const std::string& dn, bool operational ) -> mtc::zmap
{
  auto  pentry = Find( dn );
  auto  output = pentry != nullptr ? *pentry : mtc::zmap();

  fetched.push_back( dn );

  if ( pentry != nullptr && !operational )
    for ( auto next: operationalAttrs )
      arbor::DelAttribute( output, next );

  return output;
}

void  DirectoryStub::Modify( const std::string& dn, const mtc::zmap& mods )
{
  auto  pfound = entries.find( GetKey( dn ) );

  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( pfound == entries.end() )
    throw arbor::NotFound( mtc::strprintf( "no such entry '%s'", dn.c_str() ) );

  for ( auto& next: mods )
    arbor::SetAttribute( pfound->second, next.first.to_charstr(), arbor::GetStrings( next.second ) );

  modified.push_back( dn );
}

void  DirectoryStub::Create( const std::string& dn, const mtc::zmap& attrs )
{
  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( Find( dn ) != nullptr )
    throw std::runtime_error( mtc::strprintf( "entry '%s' already exists", dn.c_str() ) );

  AddEntry( dn, attrs );
}

void  DirectoryStub::Delete( const std::string& dn )
{
  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( entries.erase( GetKey( dn ) ) == 0 )
    throw arbor::NotFound( mtc::strprintf( "no such entry '%s'", dn.c_str() ) );
}

void  DirectoryStub::DeleteValues( const std::string& dn, const mtc::zmap& attrs )
{
  auto  pfound = entries.find( GetKey( dn ) );

  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( pfound == entries.end() )
    throw arbor::NotFound( mtc::strprintf( "no such entry '%s'", dn.c_str() ) );

  for ( auto& next: attrs )
  {
    auto  attr = std::string( next.first.to_charstr() );
    auto  drop = arbor::GetStrings( next.second );
    auto  keep = arbor::GetAttribute( pfound->second, attr );

    if ( drop.empty() )
    {
      arbor::DelAttribute( pfound->second, attr );
      continue;
    }

    keep.erase( std::remove_if( keep.begin(), keep.end(), [&]( const std::string& s )
      {  return std::find( drop.begin(), drop.end(), s ) != drop.end();  } ), keep.end() );

    arbor::SetAttribute( pfound->second, attr, keep );
  }
}

void  DirectoryStub::Move( const std::string& dn, const std::string& newRdn, const mtc::zmap& attrs )
{
  auto  pfound = entries.find( GetKey( dn ) );

  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( pfound == entries.end() )
    throw arbor::NotFound( mtc::strprintf( "no such entry '%s'", dn.c_str() ) );

  auto  parent = arbor::dn::GetParent( dn );
  auto  newdn = parent.empty() ? newRdn : newRdn + ',' + parent;
  auto  entry = std::move( pfound->second );

  entries.erase( pfound );

  for ( auto& next: attrs )
    arbor::SetAttribute( entry, next.first.to_charstr(), arbor::GetStrings( next.second ) );

  AddEntry( newdn, entry );
}

void  DirectoryStub::Copy( const std::string& dn, const std::string& newDn, const mtc::zmap& attrs )
{
  auto  pentry = Find( dn );

  if ( failWrites )
    throw std::runtime_error( "write failed" );
  if ( pentry == nullptr )
    throw arbor::NotFound( mtc::strprintf( "no such entry '%s'", dn.c_str() ) );

  auto  entry = *pentry;

  for ( auto& next: attrs )
    arbor::SetAttribute( entry, next.first.to_charstr(), arbor::GetStrings( next.second ) );

  AddEntry( newDn, entry );
}

auto  CreateTestDirectory() -> mtc::api<DirectoryStub>
{
  auto  stub = mtc::api<DirectoryStub>( new DirectoryStub() );

  stub->AddEntry( testBaseDn, {
    { "objectClass", mtc::array_charstr{ "top", "dcObject", "organizationalUnit" } },
    { "dc", mtc::array_charstr{ "acme" } },
    { "ou", mtc::array_charstr{ "Acme" } } } );
  stub->AddEntry( testPeopleDn, {
    { "objectClass", mtc::array_charstr{ "top", "organizationalUnit" } },
    { "ou", mtc::array_charstr{ "people" } } } );
  stub->AddEntry( testPersonDn, {
    { "objectClass", mtc::array_charstr{ "top", "person", "organizationalPerson", "inetOrgPerson", "posixAccount" } },
    { "cn", mtc::array_charstr{ "Hermione Granger" } },
    { "sn", mtc::array_charstr{ "Granger" } },
    { "givenName", mtc::array_charstr{ "Hermione" } },
    { "uid", mtc::array_charstr{ "hgranger" } },
    { "uidNumber", mtc::array_charstr{ "1001" } },
    { "displayName", mtc::array_charstr{ "Hermione" } },
    { "mail", mtc::array_charstr{ "hermione@acme.com", "hgranger@acme.com" } },
    { "createTimestamp", mtc::array_charstr{ "20261019000000Z" } } } );
  stub->AddEntry( "uid=rweasley,ou=people,dc=acme,dc=com", {
    { "objectClass", mtc::array_charstr{ "top", "person", "organizationalPerson", "inetOrgPerson", "posixAccount" } },
    { "cn", mtc::array_charstr{ "Ron Weasley" } },
    { "sn", mtc::array_charstr{ "Weasley" } },
    { "uid", mtc::array_charstr{ "rweasley" } },
    { "uidNumber", mtc::array_charstr{ "1002" } } } );
  stub->AddEntry( testHostsDn, {
    { "objectClass", mtc::array_charstr{ "top", "organizationalUnit" } },
    { "ou", mtc::array_charstr{ "hosts" } } } );
  stub->AddEntry( testHostDn, {
    { "objectClass", mtc::array_charstr{ "top", "device", "ipHost" } },
    { "cn", mtc::array_charstr{ "router" } },
    { "ipHostNumber", mtc::array_charstr{ "10.0.0.1" } } } );
  stub->AddEntry( testSubHostsDn, {
    { "objectClass", mtc::array_charstr{ "top", "organizationalUnit" } },
    { "ou", mtc::array_charstr{ "subhosts" } } } );
  stub->AddEntry( "cn=laptop,ou=subhosts,ou=hosts,dc=acme,dc=com", {
    { "objectClass", mtc::array_charstr{ "top", "device", "ieee802Device" } },
    { "cn", mtc::array_charstr{ "laptop" } },
    { "macAddress", mtc::array_charstr{ "00:11:22:33:44:55" } } } );
  stub->AddEntry( testRoomsDn, {
    { "objectClass", mtc::array_charstr{ "top", "organizationalUnit" } },
    { "ou", mtc::array_charstr{ "rooms" } } } );
  stub->AddEntry( "cn=boardroom,ou=rooms,dc=acme,dc=com", {
    { "objectClass", mtc::array_charstr{ "top", "device" } },
    { "cn", mtc::array_charstr{ "boardroom" } } } );

  return stub;
}
