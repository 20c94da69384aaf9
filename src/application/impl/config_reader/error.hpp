#ifndef BLOCKWATCH_APPLICATION_CONFIG_READER_ERROR_HPP
#define BLOCKWATCH_APPLICATION_CONFIG_READER_ERROR_HPP

#include "outcome/outcome.hpp"

namespace blockwatch::application {

  /**
   * Codes for errors that originate in configuration readers
   */
  enum class ConfigReaderError {
    MISSING_ENTRY = 1,
    PARSER_ERROR,
    INVALID_ENTRY
  };

}

OUTCOME_HPP_DECLARE_ERROR_2(blockwatch::application, ConfigReaderError);

#endif  // BLOCKWATCH_APPLICATION_CONFIG_READER_ERROR_HPP
