# if !defined( __arbor_exceptions_hpp__ )
# define __arbor_exceptions_hpp__
# include <stdexcept>

namespace arbor {

  class InvalidDN: public std::invalid_argument         {  using std::invalid_argument::invalid_argument;  };
  class NotFound: public std::runtime_error             {  using std::runtime_error::runtime_error;  };
  class UnknownAttribute: public std::invalid_argument  {  using std::invalid_argument::invalid_argument;  };
  class ConfigurationError: public std::logic_error     {  using std::logic_error::logic_error;  };

namespace schema {

  class ParseError: public std::invalid_argument  {  using std::invalid_argument::invalid_argument;  };

}

  class SchemaCycle: public schema::ParseError          {  using schema::ParseError::ParseError;  };

}

# endif   // !__arbor_exceptions_hpp__
