# include "../branch.hpp"
# include "../queries.hpp"
# include "value-tools.hpp"
# include <spdlog/spdlog.h>
# include <mtc/wcsstr.h>
# include <algorithm>

namespace arbor {

  static  auto  GetEntryDn( const mtc::zmap& entry ) -> std::string
  {
    auto  values = GetAttribute( entry, "dn" );

    if ( values.empty() )
      throw InvalidDN( "raw entry has no 'dn' value" );
    return values.front();
  }

  template <class Container, class Value>
  static  bool  Contains( const Container& container, const Value& value )
  {
    return std::find( container.begin(), container.end(), value ) != container.end();
  }

  // Branch implementation

  Branch::Branch( const Directory& dir, const std::string& dn ):
    directory( dir ),
    distName( dn )
  {
    if ( !dn::IsValid( distName ) )
      throw InvalidDN( mtc::strprintf( "invalid distinguished name '%s'", distName.c_str() ) );
  }

  Branch::Branch( const Directory& dir, const mtc::zmap& entry ):
    Branch( dir, GetEntryDn( entry ) )
  {
    rawEntry = entry;
  }

  auto  Branch::GetRdn() const -> std::string
  {
    return dn::SplitDn( distName, 2 ).front();
  }

  auto  Branch::GetRdnPairs() const -> dn::RDN
  {
    return dn::ParseRdn( GetRdn() );
  }

  auto  Branch::GetParentDn() const -> std::string
  {
    return dn::GetParent( distName );
  }

  auto  Branch::SplitDn( unsigned limit ) const -> std::vector<std::string>
  {
    return dn::SplitDn( distName, limit );
  }

  auto  Branch::GetParent() const -> Branch
  {
    auto  parent = Branch( directory, GetParentDn() );

    return parent.SetBranchClass( branchClass );
  }

  auto  Branch::GetChildren() const -> std::vector<Branch>
  {
    return GetBranchset().Scope( arbor::Scope::onelevel ).All();
  }

  auto  Branch::Child( const std::string& attr, const std::string& value, const mtc::zmap& extra ) const -> Branch
  {
    auto& schema = directory.GetSchema();
    auto  rdnset = dn::RDN{ { attr, value } };

    for ( auto& next: extra )
    {
      if ( !next.first.is_charstr() )
        throw std::invalid_argument( "RDN attribute name has to be string" );
      rdnset.push_back( { next.first.to_charstr(), ToString( next.second ) } );
    }

    for ( auto& next: rdnset )
      if ( schema.GetAttributeType( next.attr ) == nullptr )
        throw UnknownAttribute( mtc::strprintf( "no attributeType found for '%s'", next.attr.c_str() ) );

    auto  child = Branch( directory, dn::MakeRdn( rdnset ) + ',' + distName );

    return child.SetBranchClass( branchClass );
  }

  auto  Branch::SetRdn( const std::string& rdn ) -> Branch&
  {
    auto  parent = GetParentDn();

    return SetDn( parent.empty() ? rdn : rdn + ',' + parent );
  }

  auto  Branch::SetDn( const std::string& dn ) -> Branch&
  {
    if ( !dn::IsValid( dn ) )
      throw InvalidDN( mtc::strprintf( "invalid distinguished name '%s'", dn.c_str() ) );

    distName = dn;
    Clear();

    return *this;
  }

  auto  Branch::GetEntry() const -> const mtc::zmap&
  {
    if ( !rawEntry.has_value() )
      rawEntry = directory.GetEntry( distName, operational );
    return *rawEntry;
  }

  bool  Branch::Exists() const
  {
    try
    {
      return !GetEntry().empty();
    }
    catch ( const NotFound& )
    {
      return false;
    }
  }

  auto  Branch::IncludeOperational( bool include ) -> Branch&
  {
    if ( operational != include )
    {
      operational = include;
      Clear();
    }
    return *this;
  }

  void  Branch::Clear()
  {
    rawEntry.reset();
    decoded.clear();
  }

 /*
  * FindAttribute( entry, attype, attr )
  *
  * Raw values stored under the OID or any of the names of the attribute
  * type; the name as passed if the type is unknown.
  */
  static  auto  FindAttribute( const mtc::zmap& entry, const schema::AttributeType* attype,
    const std::string_view& attr ) -> const mtc::zval*
  {
    const mtc::zval*  pvalue;

    if ( attype == nullptr )
      return FindAttribute( entry, attr );

    pvalue = FindAttribute( entry, attype->oid );

    for ( auto next = attype->names.begin(); pvalue == nullptr && next != attype->names.end(); ++next )
      pvalue = FindAttribute( entry, *next );

    return pvalue;
  }

  auto  Branch::Get( const std::string_view& attr ) const -> const mtc::zval*
  {
    auto  attype = directory.GetSchema().GetAttributeType( attr );

    if ( attype == nullptr )
    {
      spdlog::info( "[Branch] no attributeType found for '{}'", attr );
      return nullptr;
    }

    auto  key = LowerCase( attype->GetName() );
    auto  pfound = decoded.find( key );

    if ( pfound != decoded.end() )
    {
      spdlog::debug( "[Branch] cached value of '{}' for '{}'", key, distName );
      return &pfound->second;
    }

    if ( !Exists() )
      return nullptr;

    auto  pvalue = FindAttribute( *rawEntry, attype, attr );

    if ( pvalue == nullptr )
      return nullptr;

    spdlog::debug( "[Branch] decoding '{}' for '{}'", key, distName );

    return &decoded.emplace( key, directory.Decode( attype->oid, GetStrings( *pvalue ) ) ).first->second;
  }

  auto  Branch::GetValues( const std::string_view& attr ) const -> std::vector<std::string>
  {
    const mtc::zval*  pvalue;

    if ( !Exists() )
      return {};

    pvalue = FindAttribute( *rawEntry, directory.GetSchema().GetAttributeType( attr ), attr );

    return pvalue != nullptr ? GetStrings( *pvalue ) : std::vector<std::string>();
  }

  void  Branch::Set( const std::string& attr, const mtc::zval& value )
  {
    auto  values = GetStrings( value );
    auto  attype = directory.GetSchema().GetAttributeType( attr );

    directory.Modify( distName, mtc::zmap{ { attr.c_str(), mtc::array_charstr( values.begin(), values.end() ) } } );

    decoded.erase( LowerCase( attype != nullptr ? attype->GetName() : attr ) );

    if ( rawEntry.has_value() )
    {
      if ( attype != nullptr )
      {
        DelAttribute( *rawEntry, attype->oid );

        for ( auto& next: attype->names )
          DelAttribute( *rawEntry, next );
      }
      SetAttribute( *rawEntry, attr, values );
    }
  }

  void  Branch::Merge( const mtc::zmap& attrs )
  {
    directory.Modify( distName, attrs );
    Clear();
  }

  void  Branch::Delete()
  {
    directory.Delete( distName );
    Clear();
  }

  void  Branch::Delete( const mtc::zmap& attrs )
  {
    directory.DeleteValues( distName, attrs );
    Clear();
  }

  void  Branch::Delete( const std::vector<std::string>& attrs )
  {
    auto  values = mtc::zmap();

    for ( auto& next: attrs )
      values.set_array_charstr( next.c_str(), mtc::array_charstr() );

    Delete( values );
  }

  void  Branch::Create( const mtc::zmap& attrs )
  {
    directory.Create( distName, attrs );
    Clear();
  }

  auto  Branch::Copy( const std::string& newDn, const mtc::zmap& attrs ) const -> Branch
  {
    auto  target = Branch( directory, newDn );

    directory.Copy( distName, newDn, attrs );

    return target.SetBranchClass( branchClass );
  }

  auto  Branch::Move( const std::string& newRdn, const mtc::zmap& attrs ) -> Branch&
  {
    auto  parent = GetParentDn();
    auto  newdn = parent.empty() ? newRdn : newRdn + ',' + parent;

    if ( !dn::IsValid( newdn ) )
      throw InvalidDN( mtc::strprintf( "invalid relative distinguished name '%s'", newRdn.c_str() ) );

    directory.Move( distName, newRdn, attrs );

    distName = std::move( newdn );
    Clear();

    return *this;
  }

  // schema helpers

  auto  Branch::GetObjectClasses( const std::vector<std::string>& extra ) const -> ObjectClasses
  {
    auto& schema = directory.GetSchema();
    auto  output = ObjectClasses();
    auto  oclist = GetValues( "objectClass" );

    oclist.insert( oclist.end(), extra.begin(), extra.end() );

    for ( auto& next: oclist )
    {
      auto  oclass = schema.GetObjectClass( next );

      if ( oclass == nullptr )
        spdlog::info( "[Branch] no objectClass found for '{}'", next );
      else
      if ( !Contains( output, oclass ) )
        output.push_back( oclass );
    }
    return output;
  }

  static  auto  GetAttributeTypes( const schema::Schema& schema, const Branch::ObjectClasses& classes,
    std::vector<std::string> schema::ObjectClass::*member ) -> Branch::AttributeTypes
  {
    auto  output = Branch::AttributeTypes();

    for ( auto& oclass: classes )
      for ( auto& name: (*oclass).*member )
      {
        auto  attype = schema.GetAttributeType( name );

        if ( attype == nullptr )
          spdlog::warn( "[Branch] objectClass '{}' refers to unknown attributeType '{}'", oclass->GetName(), name );
        else
        if ( !Contains( output, attype ) )
          output.push_back( attype );
      }

    return output;
  }

  static  auto  GetOids( const Branch::AttributeTypes& attypes ) -> std::vector<std::string>
  {
    auto  output = std::vector<std::string>();

    for ( auto& next: attypes )
      output.push_back( next->oid );

    return output;
  }

  auto  Branch::GetMustAttributeTypes( const std::vector<std::string>& extra ) const -> AttributeTypes
  {
    return GetAttributeTypes( directory.GetSchema(), GetObjectClasses( extra ), &schema::ObjectClass::must );
  }

  auto  Branch::GetMayAttributeTypes( const std::vector<std::string>& extra ) const -> AttributeTypes
  {
    return GetAttributeTypes( directory.GetSchema(), GetObjectClasses( extra ), &schema::ObjectClass::may );
  }

  auto  Branch::GetValidAttributeTypes( const std::vector<std::string>& extra ) const -> AttributeTypes
  {
    auto  output = GetMustAttributeTypes( extra );

    for ( auto& next: GetMayAttributeTypes( extra ) )
      if ( !Contains( output, next ) )
        output.push_back( next );

    return output;
  }

  auto  Branch::GetMustOids( const std::vector<std::string>& extra ) const -> std::vector<std::string>
  {
    return GetOids( GetMustAttributeTypes( extra ) );
  }

  auto  Branch::GetMayOids( const std::vector<std::string>& extra ) const -> std::vector<std::string>
  {
    return GetOids( GetMayAttributeTypes( extra ) );
  }

  auto  Branch::GetValidAttributeOids( const std::vector<std::string>& extra ) const -> std::vector<std::string>
  {
    return GetOids( GetValidAttributeTypes( extra ) );
  }

  auto  Branch::GetSchemaAttributes( const AttributeTypes& attypes ) const -> mtc::zmap
  {
    auto  output = mtc::zmap();

    for ( auto& next: attypes )
      if ( next->singleValued ) output.set_charstr( next->GetName().c_str(), "" );
        else output.set_array_charstr( next->GetName().c_str(), mtc::array_charstr() );

    return output;
  }

  auto  Branch::GetMustAttributes( const std::vector<std::string>& extra ) const -> mtc::zmap
  {
    return GetSchemaAttributes( GetMustAttributeTypes( extra ) );
  }

  auto  Branch::GetMayAttributes( const std::vector<std::string>& extra ) const -> mtc::zmap
  {
    return GetSchemaAttributes( GetMayAttributeTypes( extra ) );
  }

  bool  Branch::IsValidAttribute( const std::string_view& attr ) const
  {
    auto  attype = directory.GetSchema().GetAttributeType( attr );

    return attype != nullptr && Contains( GetValidAttributeTypes(), attype );
  }

  // queries

  auto  Branch::GetBranchset() const -> queries::Branchset
  {
    return queries::Branchset( *this );
  }

  auto  Branch::Filter( const mtc::zval& criteria ) const -> queries::Branchset
  {
    return GetBranchset().Filter( criteria );
  }

  auto  Branch::Scope( unsigned scope ) const -> queries::Branchset
  {
    return GetBranchset().Scope( scope );
  }

  auto  Branch::Scope( const std::string& scope ) const -> queries::Branchset
  {
    return GetBranchset().Scope( scope );
  }

  auto  Branch::Select( const std::vector<std::string>& attrs ) const -> queries::Branchset
  {
    return GetBranchset().Select( attrs );
  }

  // type and ordering

  auto  Branch::GetTypeName() const -> std::string
  {
    return branchClass != nullptr ? branchClass->GetName() : "branch";
  }

  auto  Branch::SetBranchClass( mtc::api<const IBranchClass> bclass ) -> Branch&
  {
    branchClass = bclass;
    return *this;
  }

  auto  Branch::SetMixins( Mixins list ) -> Branch&
  {
    mixins = std::move( list );
    return *this;
  }

  bool  Branch::HasMixin( const std::string_view& name ) const
  {
    for ( auto& next: mixins )
      if ( next->GetName() == name )
        return true;
    return false;
  }

  auto  Branch::Compare( const Branch& other ) const -> std::optional<int>
  {
    if ( GetTypeName() != other.GetTypeName() )
      return std::nullopt;
    return dn::Compare( distName, other.distName );
  }

  bool  Branch::operator == ( const Branch& other ) const
  {
    return directory == other.directory
      && GetTypeName() == other.GetTypeName()
      && dn::Compare( distName, other.distName ) == 0;
  }

}
