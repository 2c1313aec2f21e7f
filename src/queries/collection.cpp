# include "../../queries.hpp"

namespace arbor {
namespace queries {

  // BranchCollection implementation

  BranchCollection::BranchCollection( std::vector<Branchset> list ):
    branchsets( std::move( list ) )  {}

  BranchCollection::BranchCollection( std::initializer_list<Branchset> list ):
    branchsets( list )  {}

  template <class Modify>
  auto  BranchCollection::Transform( Modify modify ) const -> BranchCollection
  {
    auto  output = std::vector<Branchset>();

    for ( auto& next: branchsets )
      output.push_back( modify( next ) );

    return BranchCollection( std::move( output ) );
  }

  auto  BranchCollection::Filter( const mtc::zval& criteria ) const -> BranchCollection
  {
    auto  filter = CompileFilter( criteria );

    return Transform( [&]( const Branchset& b ){  return b.Filter( filter );  } );
  }

  auto  BranchCollection::Scope( unsigned scope ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.Scope( scope );  } );
  }

  auto  BranchCollection::Scope( const std::string& scope ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.Scope( scope );  } );
  }

  auto  BranchCollection::Select( const std::vector<std::string>& attrs ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.Select( attrs );  } );
  }

  auto  BranchCollection::SelectAll() const -> BranchCollection
  {
    return Transform( []( const Branchset& b ){  return b.SelectAll();  } );
  }

  auto  BranchCollection::SelectMore( const std::vector<std::string>& attrs ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.SelectMore( attrs );  } );
  }

  auto  BranchCollection::Limit( unsigned limit ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.Limit( limit );  } );
  }

  auto  BranchCollection::WithoutLimit() const -> BranchCollection
  {
    return Transform( []( const Branchset& b ){  return b.WithoutLimit();  } );
  }

  auto  BranchCollection::Timeout( double timeout ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.Timeout( timeout );  } );
  }

  auto  BranchCollection::WithoutTimeout() const -> BranchCollection
  {
    return Transform( []( const Branchset& b ){  return b.WithoutTimeout();  } );
  }

  auto  BranchCollection::As( mtc::api<const IBranchClass> bclass ) const -> BranchCollection
  {
    return Transform( [&]( const Branchset& b ){  return b.As( bclass );  } );
  }

  auto  BranchCollection::GetBaseDns() const -> std::vector<std::string>
  {
    auto  output = std::vector<std::string>();

    for ( auto& next: branchsets )
      output.push_back( next.GetBaseDn() );

    return output;
  }

  void  BranchCollection::Each( const Receiver& receiver ) const
  {
    for ( auto& next: branchsets )
      next.Each( receiver );
  }

  auto  BranchCollection::All() const -> std::vector<Branch>
  {
    auto  output = std::vector<Branch>();

    for ( auto& next: branchsets )
    {
      auto  found = next.All();

      output.insert( output.end(), found.begin(), found.end() );
    }
    return output;
  }

  auto  BranchCollection::First() const -> std::optional<Branch>
  {
    for ( auto& next: branchsets )
    {
      auto  first = next.First();

      if ( first.has_value() )
        return first;
    }
    return std::nullopt;
  }

  bool  BranchCollection::Empty() const
  {
    return !First().has_value();
  }

  auto  BranchCollection::Map( const std::string& attr ) const -> std::vector<mtc::zval>
  {
    auto  output = std::vector<mtc::zval>();

    for ( auto& next: branchsets )
    {
      auto  mapped = next.Map( attr );

      output.insert( output.end(), mapped.begin(), mapped.end() );
    }
    return output;
  }

  auto  BranchCollection::ToHash( const std::string& keyAttr ) const -> std::map<std::string, mtc::zmap>
  {
    auto  output = std::map<std::string, mtc::zmap>();

    for ( auto& next: branchsets )
      for ( auto& item: next.ToHash( keyAttr ) )
        output[item.first] = std::move( item.second );

    return output;
  }

  auto  BranchCollection::ToHash( const std::string& keyAttr, const std::string& valueAttr ) const -> std::map<std::string, mtc::zval>
  {
    auto  output = std::map<std::string, mtc::zval>();

    for ( auto& next: branchsets )
      for ( auto& item: next.ToHash( keyAttr, valueAttr ) )
        output[item.first] = std::move( item.second );

    return output;
  }

  auto  BranchCollection::Combine( const Branchset& other ) const -> BranchCollection
  {
    auto  output = *this;

    output.branchsets.push_back( other );
    return output;
  }

  auto  BranchCollection::Combine( const Branch& other ) const -> BranchCollection
  {
    return Combine( other.GetBranchset() );
  }

  auto  BranchCollection::Combine( const BranchCollection& other ) const -> BranchCollection
  {
    auto  output = *this;

    output.branchsets.insert( output.branchsets.end(), other.branchsets.begin(), other.branchsets.end() );
    return output;
  }

}}
