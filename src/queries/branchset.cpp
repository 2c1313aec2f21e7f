# include "../../queries.hpp"
# include "../value-tools.hpp"
# include <spdlog/spdlog.h>
# include <mtc/wcsstr.h>
# include <algorithm>

namespace arbor {
namespace queries {

  // Branchset implementation

  Branchset::Branchset( const Branch& branch, const queries::Filter& initial ):
    base( std::make_shared<const Branch>( branch ) ),
    filter( initial ),
    scope( arbor::Scope::subtree )  {}

  auto  Branchset::Filter( const mtc::zval& criteria ) const -> Branchset
  {
    return Filter( CompileFilter( criteria ) );
  }

  auto  Branchset::Filter( const queries::Filter& next ) const -> Branchset
  {
    auto  output = *this;

    output.filter = Conjoin( filter, next );
    return output;
  }

  auto  Branchset::Scope( unsigned value ) const -> Branchset
  {
    auto  output = *this;

    if ( value > arbor::Scope::subtree )
      throw std::invalid_argument( mtc::strprintf( "invalid search scope %u", value ) );

    output.scope = value;
    output.scopeName.clear();
    return output;
  }

  auto  Branchset::Scope( const std::string& value ) const -> Branchset
  {
    auto  output = *this;

    if ( (output.scope = arbor::Scope::Parse( value )) == arbor::Scope::unknown )
    {
      spdlog::debug( "[Branchset] keeping unrecognized scope '{}'", value );
      output.scopeName = value;
    }
      else
    output.scopeName.clear();

    return output;
  }

  auto  Branchset::Select( const std::vector<std::string>& attrs ) const -> Branchset
  {
    return SelectAll().SelectMore( attrs );
  }

  auto  Branchset::SelectAll() const -> Branchset
  {
    auto  output = *this;

    output.select.clear();
    return output;
  }

  auto  Branchset::SelectMore( const std::vector<std::string>& attrs ) const -> Branchset
  {
    auto  output = *this;

    for ( auto& next: attrs )
    {
      auto  pfound = std::find_if( output.select.begin(), output.select.end(), [&]( const std::string& s )
        {  return EqualNoCase( s, next );  } );

      if ( pfound == output.select.end() )
        output.select.push_back( next );
    }

    return output;
  }

  auto  Branchset::Limit( unsigned value ) const -> Branchset
  {
    auto  output = *this;

    output.limit = value;
    return output;
  }

  auto  Branchset::WithoutLimit() const -> Branchset
  {
    return Limit( 0 );
  }

  auto  Branchset::Timeout( double value ) const -> Branchset
  {
    auto  output = *this;

    if ( value < 0 )
      throw std::invalid_argument( "search timeout must not be negative" );

    output.timeout = value;
    return output;
  }

  auto  Branchset::WithoutTimeout() const -> Branchset
  {
    return Timeout( 0 );
  }

  auto  Branchset::As( mtc::api<const IBranchClass> bclass ) const -> Branchset
  {
    auto  output = *this;

    output.branchClass = bclass;
    return output;
  }

  auto  Branchset::With( const std::string& key, const mtc::zval& value ) const -> Branchset
  {
    auto  output = *this;

    output.options.put( key.c_str(), value );
    return output;
  }

  auto  Branchset::GetScopeName() const -> std::string
  {
    return scope == arbor::Scope::unknown ? scopeName : arbor::Scope::to_string( scope );
  }

  auto  Branchset::GetSearchParams() const -> SearchParams
  {
    auto  params = SearchParams();

    params.limit = limit;
    params.selectattrs = select;
    params.timeout = timeout;

    for ( auto& control: GetDirectory().GetControls() )
    {
      auto  client = control->GetClientControls( options );
      auto  server = control->GetServerControls( options );

      params.clientControls.insert( params.clientControls.end(), client.begin(), client.end() );
      params.serverControls.insert( params.serverControls.end(), server.begin(), server.end() );
    }

    return params;
  }

 /*
  * to_string()
  *
  * base?attributes?scope?filter, the way search URLs are written
  */
  auto  Branchset::to_string() const -> std::string
  {
    auto  output = GetBaseDn() + '?';

    for ( auto& next: select )
      output += (&next == select.data() ? "" : ",") + next;

    return output + '?' + GetScopeName() + '?' + GetFilterString();
  }

  void  Branchset::Search( const SearchParams& params, const Receiver& receiver ) const
  {
    if ( scope == arbor::Scope::unknown )
      throw std::invalid_argument( mtc::strprintf( "unknown search scope '%s'", scopeName.c_str() ) );

    GetDirectory().Search( GetBaseDn(), scope, GetFilterString(), params, [&]( const mtc::zmap& entry )
      {
        auto  branch = Branch( GetDirectory(), entry );

        if ( branchClass != nullptr )
          branchClass->Prepare( branch.SetBranchClass( branchClass ) );

        receiver( branch );
      } );
  }

  void  Branchset::Each( const Receiver& receiver ) const
  {
    Search( GetSearchParams(), receiver );
  }

  auto  Branchset::All() const -> std::vector<Branch>
  {
    auto  output = std::vector<Branch>();

    Each( [&]( const Branch& branch ){  output.push_back( branch );  } );
    return output;
  }

  auto  Branchset::First() const -> std::optional<Branch>
  {
    auto  params = GetSearchParams();
    auto  output = std::optional<Branch>();

    params.limit = 1;

    Search( params, [&]( const Branch& branch )
      {
        if ( !output.has_value() )
          output = branch;
      } );

    return output;
  }

  bool  Branchset::Empty() const
  {
    return !First().has_value();
  }

  auto  Branchset::Map( const std::string& attr ) const -> std::vector<mtc::zval>
  {
    auto  output = std::vector<mtc::zval>();

    Each( [&]( const Branch& branch )
      {
        auto  pvalue = branch.Get( attr );

        output.push_back( pvalue != nullptr ? *pvalue : mtc::zval() );
      } );

    return output;
  }

  auto  Branchset::ToHash( const std::string& keyAttr ) const -> std::map<std::string, mtc::zmap>
  {
    auto  output = std::map<std::string, mtc::zmap>();

    Each( [&]( const Branch& branch )
      {
        auto  keys = branch.GetValues( keyAttr );

        if ( !keys.empty() )
          output[keys.front()] = branch.GetEntry();
      } );

    return output;
  }

  auto  Branchset::ToHash( const std::string& keyAttr, const std::string& valueAttr ) const -> std::map<std::string, mtc::zval>
  {
    auto  output = std::map<std::string, mtc::zval>();

    Each( [&]( const Branch& branch )
      {
        auto  keys = branch.GetValues( keyAttr );
        auto  pval = branch.Get( valueAttr );

        if ( keys.empty() )
          return;

        if ( pval == nullptr )
          output[keys.front()] = mtc::zval();
        else
        if ( pval->get_type() == mtc::zval::z_array_zval )
          output[keys.front()] = pval->get_array_zval()->empty() ? mtc::zval() : pval->get_array_zval()->front();
        else
          output[keys.front()] = *pval;
      } );

    return output;
  }

  auto  Branchset::Combine( const Branchset& other ) const -> BranchCollection
  {
    return BranchCollection{ *this, other };
  }

  auto  Branchset::Combine( const Branch& other ) const -> BranchCollection
  {
    return BranchCollection{ *this, other.GetBranchset() };
  }

}}
