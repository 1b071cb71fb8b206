#include "TestParameters.h"
#include <stdexcept>
#include <boost/algorithm/string.hpp>

namespace abplanner
{
  std::string testTypeToString(TestType type)
  {
    return (type == TestType::ONE_TAILED) ? "one_tailed" : "two_tailed";
  }

  std::string effectTypeToString(EffectType type)
  {
    return (type == EffectType::RELATIVE) ? "relative" : "absolute";
  }

  TestType parseTestType(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "one_tailed")
      return TestType::ONE_TAILED;
    if (key == "two_tailed")
      return TestType::TWO_TAILED;

    throw std::invalid_argument("Unknown test type: " + text);
  }

  EffectType parseEffectType(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "absolute")
      return EffectType::ABSOLUTE;
    if (key == "relative")
      return EffectType::RELATIVE;

    throw std::invalid_argument("Unknown effect type: " + text);
  }
}
