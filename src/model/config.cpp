# include "../../model/config.hpp"
# include "../value-tools.hpp"
# include <mtc/wcsstr.h>
# include <cstring>

namespace arbor {
namespace model {

  class NamedCapability final: public ICapability
  {
    implement_lifetime_control

  public:
    NamedCapability( const std::string& s ):
      name( s ) {}

    auto  GetName() const -> std::string override  {  return name;  }

  protected:
    const std::string name;

  };

  auto  MakeCapability( const std::string& name ) -> Capability
  {
    if ( name.empty() )
      throw std::invalid_argument( "capability name must not be empty" );
    return new NamedCapability( name );
  }

  static  bool  IsKey( const mtc::zmap::key& k, const char* s )
  {
    if ( !k.is_charstr() )
      throw ConfigurationError( "model declaration keys must be strings" );
    return strcmp( k.to_charstr(), s ) == 0;
  }

  static  auto  GetList( const mtc::zval& value, const char* name ) -> std::vector<std::string>
  {
    switch ( value.get_type() )
    {
      case mtc::zval::z_charstr:
      case mtc::zval::z_widestr:
      case mtc::zval::z_array_charstr:
      case mtc::zval::z_array_zval:
        break;
      default:
        throw ConfigurationError( mtc::strprintf( "model '%s' has to be string or array of strings", name ) );
    }

    try
    {
      return GetStrings( value );
    }
    catch ( const std::invalid_argument& )
    {
      throw ConfigurationError( mtc::strprintf( "model '%s' has to be string or array of strings", name ) );
    }
  }

  static  auto  FindByName( const Models& models, const std::string& name ) -> Capability
  {
    for ( auto& modelClass: models.List() )
    {
      auto  cap = models.Find( modelClass )->Find( name );

      if ( cap != nullptr )
        return cap;
    }
    return nullptr;
  }

  static  void  ParseModel( Models& models, const mtc::zmap& decl )
  {
    auto  name = decl.get_charstr( "name" );
    auto  classes = std::vector<std::string>();
    auto  bases = std::vector<std::string>();
    auto  modelClass = std::string( "default" );

    if ( name == nullptr )
    {
      throw decl.get( "name" ) == nullptr ?
        ConfigurationError( "model declaration has to have 'name' string field" )
      : ConfigurationError( "model 'name' has to be string" );
    }

    if ( FindByName( models, *name ) != nullptr )
      throw ConfigurationError( mtc::strprintf( "model '%s' is already declared", name->c_str() ) );

    for ( auto& next: decl )
    {
      if ( IsKey( next.first, "objectClasses" ) )
        classes = GetList( next.second, "objectClasses" );
      else
      if ( IsKey( next.first, "bases" ) )
        bases = GetList( next.second, "bases" );
      else
      if ( IsKey( next.first, "model" ) )
      {
        if ( next.second.get_type() != mtc::zval::z_charstr || next.second.get_charstr()->empty() )
          throw ConfigurationError( "model 'model' has to be non-empty string" );
        modelClass = *next.second.get_charstr();
      }
        else
      if ( !IsKey( next.first, "name" ) )
      {
        throw ConfigurationError( mtc::strprintf( "unexpected model field '%s'",
          next.first.to_charstr() ) );
      }
    }

    try
    {
      models.Declare( MakeCapability( *name ), classes, bases, modelClass );
    }
    catch ( const InvalidDN& x )
    {
      throw ConfigurationError( mtc::strprintf( "model '%s' has invalid base: %s", name->c_str(), x.what() ) );
    }
  }

  auto  LoadModels( const mtc::zmap& cfg, const mtc::zmap::key& key ) -> Models
  {
    auto  pval = cfg.get( key );

    if ( pval == nullptr )
      return {};

    switch ( pval->get_type() )
    {
      case mtc::zval::z_array_zmap:
        return LoadModels( *pval->get_array_zmap() );

      case mtc::zval::z_array_zval:
        if ( !pval->get_array_zval()->empty() )
          throw ConfigurationError( "models list is expected to be array of structures" );
        return {};

      default:
        throw ConfigurationError( "models list is expected to be array of structures" );
    }
  }

  auto  LoadModels( const mtc::array_zmap& cfg ) -> Models
  {
    Models  models;

    for ( auto& next: cfg )
      ParseModel( models, next );

    return models;
  }

  auto  SaveModels( const Models& models ) -> mtc::array_zmap
  {
    mtc::array_zmap serial;

    for ( auto& modelClass: models.List() )
    {
      auto  registry = models.Find( modelClass );

      for ( auto& cap: registry->GetCapabilities() )
      {
        auto  pdecl = registry->GetDeclaration( cap );

        serial.push_back( {
          { "name",           cap->GetName() },
          { "objectClasses",  mtc::array_charstr( pdecl->objectClasses.begin(), pdecl->objectClasses.end() ) },
          { "bases",          mtc::array_charstr( pdecl->bases.begin(), pdecl->bases.end() ) },
          { "model",          modelClass } } );
      }
    }
    return serial;
  }

}}
