# include "../../controls/sorted-results.hpp"
# include "../toolbox/directory-stub.h"
# include <mtc/test-it-easy.hpp>

using namespace arbor;
using namespace arbor::controls;

TestItEasy::RegisterFunc  test_sorted_results( []()
{
  TEST_CASE( "controls/SortedResults" )
  {
    SECTION( "sort keys are parsed" )
    {
      auto  sortKey = SortKey();

      if ( REQUIRE_NOTHROW( sortKey = ParseSortKey( "cn" ) ) )
      {
        REQUIRE( sortKey.attr == "cn" );
        REQUIRE( sortKey.orderingRule.empty() );
        REQUIRE( !sortKey.reverse );
      }
      if ( REQUIRE_NOTHROW( sortKey = ParseSortKey( "-cn:caseIgnoreOrderingMatch" ) ) )
      {
        REQUIRE( sortKey.attr == "cn" );
        REQUIRE( sortKey.orderingRule == "caseIgnoreOrderingMatch" );
        REQUIRE( sortKey.reverse );
      }
      REQUIRE_EXCEPTION( ParseSortKey( "" ), std::invalid_argument );
      REQUIRE_EXCEPTION( ParseSortKey( "-" ), std::invalid_argument );
      REQUIRE_EXCEPTION( ParseSortKey( ":rule" ), std::invalid_argument );
      REQUIRE_EXCEPTION( ParseSortKey( "cn sn" ), std::invalid_argument );
    }
    SECTION( "sort keys are encoded as BER sequence" )
    {
      REQUIRE( EncodeSortKeys( { ParseSortKey( "cn" ) } )
        == std::string( "\x30\x06\x30\x04\x04\x02" ) + "cn" );
      REQUIRE( EncodeSortKeys( { ParseSortKey( "-cn:caseIgnoreOrderingMatch" ) } )
        == std::string( "\x30\x22\x30\x20\x04\x02" ) + "cn"
         + std::string( "\x80\x17" ) + "caseIgnoreOrderingMatch"
         + std::string( "\x81\x01\xff" ) );
      REQUIRE( EncodeSortKeys( { ParseSortKey( "sn" ), ParseSortKey( "-uid" ) } )
        == std::string( "\x30\x10\x30\x04\x04\x02" ) + "sn"
         + std::string( "\x30\x08\x04\x03" ) + "uid"
         + std::string( "\x81\x01\xff" ) );

      SECTION( "long values use long form of length" )
      {
        auto  encoded = EncodeSortKeys( { ParseSortKey( std::string( 200, 'a' ) ) } );

        REQUIRE( encoded.substr( 0, 3 ) == "\x30\x81\xce" );
        REQUIRE( encoded.substr( 3, 3 ) == "\x30\x81\xcb" );
        REQUIRE( encoded.substr( 6, 3 ) == "\x04\x81\xc8" );
        REQUIRE( encoded.size() == 209 );
      }
    }
    SECTION( "OrderBy requires the control to be registered" )
    {
      auto  stub = CreateTestDirectory();
      auto  dir = Directory( stub.ptr() );

      REQUIRE_EXCEPTION( OrderBy( Branch( dir, testPeopleDn ).Scope( "one" ), { "cn" } ), std::invalid_argument );
    }
    SECTION( "ordered branchsets send the sort request" )
    {
      auto  stub = CreateTestDirectory();

      stub->AddControl( CreateSortedResults( true ) );

      auto  dir = Directory( stub.ptr() );
      auto  people = Branch( dir, testPeopleDn ).Scope( "one" );
      auto  ordered = queries::Branchset( people );

      if ( REQUIRE_NOTHROW( ordered = OrderBy( people, { "sn" } ) ) )
      {
        REQUIRE( people.GetSearchParams().serverControls.empty() );

        if ( REQUIRE_NOTHROW( ordered = OrderBy( ordered, { "-uid" } ) ) )
        {
          auto  params = ordered.GetSearchParams();

          if ( REQUIRE( params.serverControls.size() == 1 ) )
          {
            REQUIRE( params.serverControls.front().oid == sortedResultsOid );
            REQUIRE( params.serverControls.front().value == EncodeSortKeys( {
              ParseSortKey( "sn" ), ParseSortKey( "-uid" ) } ) );
            REQUIRE( params.serverControls.front().critical );
          }

          ordered.All();

          if ( REQUIRE( !stub->searches.empty() ) )
            REQUIRE( stub->searches.back().params.serverControls.size() == 1 );
        }
      }
      REQUIRE_EXCEPTION( OrderBy( people, { "-" } ), std::invalid_argument );
    }
  }
} );
