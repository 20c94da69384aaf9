#include "application/impl/config_reader/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY_3(blockwatch::application,
                              ConfigReaderError,
                              e) {
  using E = blockwatch::application::ConfigReaderError;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the provided config file";
    case E::PARSER_ERROR:
      return "The config file could not be read or is not valid JSON";
    case E::INVALID_ENTRY:
      return "An entry of the provided config file has an invalid value";
  }
  return "Unknown error";
}
