# include "../../model/registry.hpp"
# include "../value-tools.hpp"
# include <spdlog/spdlog.h>
# include <mtc/wcsstr.h>
# include <algorithm>

namespace arbor {
namespace model {

  static  bool  IsSame( const Capability& a, const Capability& b )
  {
    return a.ptr() == b.ptr();
  }

  static  void  AddUnique( Capabilities& to, const Capability& cap )
  {
    for ( auto& next: to )
      if ( IsSame( next, cap ) )
        return;
    to.push_back( cap );
  }

  static  void  AddUnique( std::vector<std::string>& to, const std::string& str )
  {
    for ( auto& next: to )
      if ( EqualNoCase( next, str ) )
        return;
    to.push_back( str );
  }

 /*
  * ObjectClassFilter()
  *
  * (objectClass=*) for no classes, equality for the single one and the
  * conjunction of equalities for multiple classes
  */
  static  auto  ObjectClassFilter( const std::vector<std::string>& classes ) -> queries::Filter
  {
    auto  andset = std::vector<queries::Filter>();

    for ( auto& next: classes )
      andset.emplace_back( queries::Filter::Equality, "objectClass", next );

    switch ( andset.size() )
    {
      case 0:   return queries::Filter();
      case 1:   return andset.front();
      default:  return queries::Filter( queries::Filter::And, std::move( andset ) );
    }
  }

  // Registry::impl

  struct Registry::impl
  {
    using Declarations = std::vector<std::pair<Capability, Declaration>>;

    std::string                         modelClass;
    Declarations                        declarations;
    std::map<std::string, Capabilities> objectClassIndex;
    std::map<std::string, Capabilities> baseIndex;
    Directory                           directory;

    impl( const std::string& name ): modelClass( name ) {}

    auto  Find( const Capability& cap ) -> Declarations::iterator
      {
        return std::find_if( declarations.begin(), declarations.end(), [&]( const Declarations::value_type& d )
          {  return IsSame( d.first, cap );  } );
      }
  };

  class ModelClass final: public IBranchClass
  {
    implement_lifetime_control

  public:
    ModelClass( const Registry& reg ):
      registry( reg ) {}

    auto  GetName() const -> std::string override
      {  return registry.GetName();  }
    void  Prepare( Branch& branch ) const override
      {  branch.SetMixins( registry.MixinsFor( branch ) );  }

  protected:
    const Registry  registry;

  };

  // Registry implementation

  Registry::Registry( const std::string& modelClass ):
    data( std::make_shared<impl>( modelClass ) )  {}

  auto  Registry::GetName() const -> const std::string&
  {
    return data->modelClass;
  }

  void  Registry::Register( const Capability& cap, const std::vector<std::string>& objectClasses, const std::vector<std::string>& bases )
  {
    auto  normals = std::vector<std::string>();

    if ( cap == nullptr )
      throw std::invalid_argument( "capability must not be null" );

    for ( auto& next: bases )
      normals.push_back( dn::Normalize( next ) );

    auto  pfound = data->Find( cap );

    if ( pfound == data->declarations.end() )
    {
      data->declarations.push_back( { cap, {} } );
      pfound = data->declarations.end() - 1;
    }

    for ( auto& next: objectClasses )
    {
      AddUnique( pfound->second.objectClasses, next );
      AddUnique( data->objectClassIndex[LowerCase( next )], cap );
    }

    for ( auto& next: normals )
    {
      AddUnique( pfound->second.bases, next );
      AddUnique( data->baseIndex[LowerCase( next )], cap );
    }

    spdlog::debug( "[Model] '{}' registered in '{}' with {} object classes, {} bases", cap->GetName(),
      data->modelClass, pfound->second.objectClasses.size(), pfound->second.bases.size() );
  }

  bool  Registry::Remove( const Capability& cap )
  {
    auto  pfound = data->Find( cap );
    auto  unlink = [&]( std::map<std::string, Capabilities>& index )
      {
        for ( auto next = index.begin(); next != index.end(); )
        {
          next->second.erase( std::remove_if( next->second.begin(), next->second.end(), [&]( const Capability& c )
            {  return IsSame( c, cap );  } ), next->second.end() );

          if ( next->second.empty() ) next = index.erase( next );
            else ++next;
        }
      };

    if ( pfound == data->declarations.end() )
      return false;

    data->declarations.erase( pfound );
      unlink( data->objectClassIndex );
      unlink( data->baseIndex );

    spdlog::debug( "[Model] '{}' removed from '{}'", cap->GetName(), data->modelClass );
    return true;
  }

  auto  Registry::GetDeclaration( const Capability& cap ) const -> const Declaration*
  {
    auto  pfound = data->Find( cap );

    return pfound != data->declarations.end() ? &pfound->second : nullptr;
  }

  auto  Registry::GetCapabilities() const -> Capabilities
  {
    auto  output = Capabilities();

    for ( auto& next: data->declarations )
      output.push_back( next.first );

    return output;
  }

  auto  Registry::Find( const std::string_view& name ) const -> Capability
  {
    for ( auto& next: data->declarations )
      if ( next.first->GetName() == name )
        return next.first;
    return nullptr;
  }

  auto  Registry::MixinsForObjectClasses( const std::vector<std::string>& classes ) const -> Capabilities
  {
    auto  ocnames = std::vector<std::string>();
    auto  matched = Capabilities();

    for ( auto& next: classes )
      ocnames.push_back( LowerCase( next ) );

    for ( auto& name: ocnames )
    {
      auto  pfound = data->objectClassIndex.find( name );

      if ( pfound == data->objectClassIndex.end() )
        continue;

      for ( auto& cap: pfound->second )
      {
        auto& declared = GetDeclaration( cap )->objectClasses;
        auto  included = std::all_of( declared.begin(), declared.end(), [&]( const std::string& s )
          {  return std::find( ocnames.begin(), ocnames.end(), LowerCase( s ) ) != ocnames.end();  } );

        if ( included )
          AddUnique( matched, cap );
      }
    }

    return matched;
  }

  auto  Registry::MixinsForDn( const std::string_view& dn ) const -> Capabilities
  {
    auto  rdnset = dn::SplitDn( dn::Normalize( dn ) );
    auto  suffix = std::string();
    auto  output = Capabilities();

    for ( auto next = rdnset.rbegin(); next != rdnset.rend(); ++next )
    {
      suffix = suffix.empty() ? LowerCase( *next ) : LowerCase( *next ) + ',' + suffix;

      auto  pfound = data->baseIndex.find( suffix );

      if ( pfound != data->baseIndex.end() )
        for ( auto& cap: pfound->second )
          AddUnique( output, cap );
    }

    return output;
  }

  auto  Registry::MixinsFor( const Branch& branch ) const -> Capabilities
  {
    auto  output = MixinsForObjectClasses( branch.GetValues( "objectClass" ) );

    for ( auto& next: MixinsForDn( branch.GetDn() ) )
      AddUnique( output, next );

    return output;
  }

  auto  Registry::SetDirectory( const Directory& directory ) -> Registry&
  {
    data->directory = directory;
    return *this;
  }

  auto  Registry::GetDirectory() const -> const Directory&
  {
    if ( data->directory == Directory() )
      throw ConfigurationError( mtc::strprintf( "model '%s' has no directory set", data->modelClass.c_str() ) );
    return data->directory;
  }

  auto  Registry::Search( const Capability& cap ) const -> SearchResult
  {
    return Search( cap, GetDirectory() );
  }

  auto  Registry::Search( const Capability& cap, const Directory& directory ) const -> SearchResult
  {
    auto  declared = GetDeclaration( cap );
    auto  bclass = AsClass();

    if ( declared == nullptr )
      throw ConfigurationError( mtc::strprintf( "capability '%s' is not registered in model '%s'",
        cap->GetName().c_str(), data->modelClass.c_str() ) );

    if ( declared->objectClasses.empty() && declared->bases.empty() )
      throw ConfigurationError( mtc::strprintf( "capability '%s' has no search criteria defined",
        cap->GetName().c_str() ) );

    auto  filter = ObjectClassFilter( declared->objectClasses );
    auto  bases = declared->bases.empty() ? std::vector<std::string>{ directory.GetBaseDn() } : declared->bases;
    auto  output = std::vector<queries::Branchset>();

    for ( auto& base: bases )
      output.push_back( queries::Branchset( Branch( directory, base ).SetBranchClass( bclass ), filter ).As( bclass ) );

    if ( output.size() == 1 )
      return std::move( output.front() );

    return queries::BranchCollection( std::move( output ) );
  }

  auto  Registry::Instantiate( const Capability& cap, const std::string& dn, const mtc::zmap& attributes ) const -> Branch
  {
    return Instantiate( cap, GetDirectory(), dn, attributes );
  }

  auto  Registry::Instantiate( const Capability& cap, const Directory& directory, const std::string& dn,
    const mtc::zmap& attributes ) const -> Branch
  {
    auto  declared = GetDeclaration( cap );
    auto  rawdata = attributes;
    auto  ocnames = std::vector<std::string>();
    auto  rdnset = dn::ParseDn( dn );

    if ( rdnset.empty() )
      throw InvalidDN( mtc::strprintf( "could not instantiate '%s' at empty DN", cap->GetName().c_str() ) );

    if ( declared == nullptr )
      throw ConfigurationError( mtc::strprintf( "capability '%s' is not registered in model '%s'",
        cap->GetName().c_str(), data->modelClass.c_str() ) );

    for ( auto& next: declared->objectClasses )
      AddUnique( ocnames, next );
    for ( auto& next: GetAttribute( rawdata, "objectClass" ) )
      AddUnique( ocnames, next );

    SetAttribute( rawdata, "objectClass", ocnames );

    for ( auto& pair: rdnset.front() )
    {
      auto  values = GetAttribute( rawdata, pair.attr );

      if ( std::find( values.begin(), values.end(), pair.value ) == values.end() )
        values.push_back( pair.value );

      SetAttribute( rawdata, pair.attr, values );
    }

    SetAttribute( rawdata, "dn", { dn } );

    auto  branch = Branch( directory, rawdata );
    auto  bclass = AsClass();

    bclass->Prepare( branch.SetBranchClass( bclass ) );

    return branch;
  }

  auto  Registry::AsClass() const -> mtc::api<const IBranchClass>
  {
    return new ModelClass( *this );
  }

  // Models implementation

  auto  Models::Get( const std::string& modelClass ) -> Registry&
  {
    auto  pfound = registries.find( modelClass );

    if ( pfound == registries.end() )
      pfound = registries.emplace( modelClass, Registry( modelClass ) ).first;

    return pfound->second;
  }

  auto  Models::Find( const std::string& modelClass ) const -> const Registry*
  {
    auto  pfound = registries.find( modelClass );

    return pfound != registries.end() ? &pfound->second : nullptr;
  }

  auto  Models::List() const -> std::vector<std::string>
  {
    auto  output = std::vector<std::string>();

    for ( auto& next: registries )
      output.push_back( next.first );

    return output;
  }

  void  Models::Declare( const Capability& cap, const std::vector<std::string>& objectClasses,
    const std::vector<std::string>& bases, const std::string& modelClass )
  {
    auto  current = GetModelClass( cap );

    if ( !current.empty() && current != modelClass )
      SetModelClass( cap, modelClass );

    Get( modelClass ).Register( cap, objectClasses, bases );
  }

  void  Models::SetModelClass( const Capability& cap, const std::string& modelClass )
  {
    auto  declared = Declaration();

    for ( auto& next: registries )
    {
      auto  pdecl = next.second.GetDeclaration( cap );

      if ( pdecl == nullptr )
        continue;

      if ( next.first == modelClass )
        return;

      declared = *pdecl;
      next.second.Remove( cap );

      spdlog::debug( "[Model] moving '{}' from '{}' to '{}'", cap->GetName(), next.first, modelClass );
      break;
    }

    Get( modelClass ).Register( cap, declared.objectClasses, declared.bases );
  }

  auto  Models::GetModelClass( const Capability& cap ) const -> std::string
  {
    for ( auto& next: registries )
      if ( next.second.GetDeclaration( cap ) != nullptr )
        return next.first;
    return {};
  }

  bool  Models::Remove( const Capability& cap )
  {
    for ( auto& next: registries )
      if ( next.second.Remove( cap ) )
        return true;
    return false;
  }

}}
