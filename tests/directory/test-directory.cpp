# include "../../queries.hpp"
# include "../toolbox/directory-stub.h"
# include "../toolbox/test-schema.h"
# include <mtc/test-it-easy.hpp>
# include <cstring>

using namespace arbor;

class PagedResults final: public IControl
{
  implement_lifetime_control

public:
  auto  GetOid() const -> std::string override  {  return "1.2.840.113556.1.4.319";  }
  auto  GetClientControls( const mtc::zmap& ) const -> std::vector<Control> override
    {  return { { "client.paged", "", false } };  }
  auto  GetServerControls( const mtc::zmap& options ) const -> std::vector<Control> override
    {
      auto  psize = options.get_int32( "page-size" );

      if ( psize == nullptr )
        return {};
      return { { GetOid(), std::to_string( *psize ), true } };
    }

};

TestItEasy::RegisterFunc  test_directory( []()
{
  TEST_CASE( "directory/Scope" )
  {
    REQUIRE( Scope::Parse( "base" ) == Scope::base );
    REQUIRE( Scope::Parse( "one" ) == Scope::onelevel );
    REQUIRE( Scope::Parse( "ONELEVEL" ) == Scope::onelevel );
    REQUIRE( Scope::Parse( "sub" ) == Scope::subtree );
    REQUIRE( Scope::Parse( "Subtree" ) == Scope::subtree );
    REQUIRE( Scope::Parse( "children" ) == Scope::unknown );
    REQUIRE( std::string( Scope::to_string( Scope::onelevel ) ) == "one" );
    REQUIRE( std::string( Scope::to_string( 9 ) ) == "unknown" );
  }
  TEST_CASE( "directory/Directory" )
  {
    auto  stub = CreateTestDirectory();

    SECTION( "directory requires the client interface" )
    {
      REQUIRE_EXCEPTION( Directory( mtc::api<IDirectory>() ), std::invalid_argument );
      REQUIRE_EXCEPTION( Directory().GetBaseDn(), std::logic_error );

      try
      {
        Directory().GetEntry( testBaseDn );
      }
      catch ( const std::logic_error& x )
      {
        REQUIRE( strstr( x.what(), "directory.cpp:" ) != nullptr );
      }
    }
    SECTION( "schema is loaded once on first use" )
    {
      auto  dir = Directory( stub.ptr() );
      auto  copy = dir;
      auto  nloads = stub->schemaLoads;

      REQUIRE( dir.GetBaseDn() == testBaseDn );
      REQUIRE( stub->schemaLoads == nloads );
      REQUIRE( dir.GetSchema().GetObjectClass( "person" ) != nullptr );
      REQUIRE( copy.GetSchema().GetObjectClass( "device" ) != nullptr );
      REQUIRE( stub->schemaLoads == nloads + 1 );
      REQUIRE( copy == dir );
      REQUIRE( Directory( stub.ptr() ) != dir );
    }
    SECTION( "schema may be set explicitly" )
    {
      auto  dir = Directory( stub.ptr() );
      auto  nloads = stub->schemaLoads;

      dir.SetSchema( schema::ParseSchema( mtc::zmap{
        { "attributeTypes", mtc::array_charstr{ "( 1.1.1 NAME 'only' SYNTAX 1.3.6.1.4.1.1466.115.121.1.15 )" } } } ) );

      REQUIRE( dir.GetSchema().GetAttributeType( "only" ) != nullptr );
      REQUIRE( dir.GetSchema().GetAttributeType( "cn" ) == nullptr );
      REQUIRE( stub->schemaLoads == nloads );
    }
    SECTION( "values are decoded by the attribute syntax" )
    {
      auto  dir = Directory( stub.ptr() );
      auto  value = mtc::zval();

      value = dir.Decode( "uidNumber", { "1001" } );
      if ( REQUIRE( value.get_int64() != nullptr ) )
        REQUIRE( *value.get_int64() == 1001 );

      value = dir.Decode( "displayName", { "Hermione", "ignored" } );
      if ( REQUIRE( value.get_charstr() != nullptr ) )
        REQUIRE( *value.get_charstr() == "Hermione" );

      value = dir.Decode( "mail", { "a@acme.com", "b@acme.com" } );
      if ( REQUIRE( value.get_array_zval() != nullptr ) )
        REQUIRE( value.get_array_zval()->size() == 2 );

      value = dir.Decode( "favouriteSpell", { "Wingardium Leviosa" } );
      REQUIRE( value.get_charstr() == nullptr );
      REQUIRE( value.get_array_zval() == nullptr );

      SECTION( "invalid integers are kept as strings" )
      {
        REQUIRE( DecodeInteger( "-42" ).get_int64() != nullptr );
        REQUIRE( *DecodeInteger( "-42" ).get_int64() == -42 );
        REQUIRE( *DecodeInteger( "42x" ).get_charstr() == "42x" );
        REQUIRE( *DecodeInteger( "" ).get_charstr() == "" );
        REQUIRE( *DecodeInteger( "99999999999999999999" ).get_charstr() == "99999999999999999999" );
      }
      SECTION( "decoders may be replaced and removed" )
      {
        dir.SetDecoder( integerSyntaxOid, nullptr );

        value = dir.Decode( "uidNumber", { "1001" } );
        if ( REQUIRE( value.get_charstr() != nullptr ) )
          REQUIRE( *value.get_charstr() == "1001" );
      }
    }
    SECTION( "missing entry throws NotFound" )
    {
      auto  dir = Directory( stub.ptr() );

      REQUIRE( dir.GetEntry( testPersonDn ).get( "cn" ) != nullptr );
      REQUIRE( dir.GetEntry( testPersonDn ).get( "createTimestamp" ) == nullptr );
      REQUIRE( dir.GetEntry( testPersonDn, true ).get( "createTimestamp" ) != nullptr );
      REQUIRE_EXCEPTION( dir.GetEntry( "uid=nobody,dc=acme,dc=com" ), NotFound );
    }
    SECTION( "registered controls are listed by the directory" )
    {
      stub->AddControl( new PagedResults() );

      auto  dir = Directory( stub.ptr() );

      REQUIRE( dir.GetControls().size() == 1 );
      REQUIRE( dir.GetControl( "1.2.840.113556.1.4.319" ) != nullptr );
      REQUIRE( dir.GetControl( "1.2.3.4" ) == nullptr );

      SECTION( "controls contribute the payloads to branchset searches" )
      {
        auto  people = Branch( dir, testPeopleDn ).Scope( "one" );
        auto  params = people.With( "page-size", 50 ).GetSearchParams();

        if ( REQUIRE( params.clientControls.size() == 1 ) )
          REQUIRE( params.clientControls.front().oid == "client.paged" );
        if ( REQUIRE( params.serverControls.size() == 1 ) )
        {
          REQUIRE( params.serverControls.front().value == "50" );
          REQUIRE( params.serverControls.front().critical );
        }
        REQUIRE( people.GetSearchParams().serverControls.empty() );

        people.With( "page-size", 50 ).All();

        REQUIRE( stub->searches.back().params.serverControls.size() == 1 );
        REQUIRE( stub->searches.back().params.clientControls.size() == 1 );
      }
    }
  }
} );
