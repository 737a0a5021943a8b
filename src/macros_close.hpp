// Undoes "macros_open.hpp".
#undef required
#undef interface
#undef unreachable
#undef unimplemented
#undef assert
