#include "Matrix-json.hpp"

#include <memory>
#include <stdexcept>

#include <fmt/format.h>

namespace Matrix {

std::string canonical_json(Json::Value const& v)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["indentation"] = "";
  wbuilder["emitUTF8"]    = true;
  return Json::writeString(wbuilder, v);
}

Json::Value parse_json(std::string_view text)
{
  Json::CharReaderBuilder rbuilder;
  Json::CharReaderBuilder::strictMode(&rbuilder.settings_);

  std::unique_ptr<Json::CharReader> const reader(rbuilder.newCharReader());

  Json::Value v;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &v, &errs)) {
    throw std::invalid_argument(fmt::format("bad JSON: {}", errs));
  }
  return v;
}

} // namespace Matrix
