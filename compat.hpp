# if !defined( __arbor_compat_hpp__ )
# define __arbor_compat_hpp__

# if !defined( LINE_STRING )
#   define __LN_STRING( arg )  #arg
#   define _LN__STRING( arg )  __LN_STRING( arg )
#   define LINE_STRING _LN__STRING(__LINE__)
# endif   // !LINE_STRING

# if defined( _MSC_VER )
#   include <string.h>
#   define strcasecmp _stricmp
#   define strncasecmp _strnicmp
# else
#   include <strings.h>
# endif

# endif   // !__arbor_compat_hpp__
