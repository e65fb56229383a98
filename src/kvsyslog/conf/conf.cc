/* <kvsyslog/conf/conf.cc>

   ----------------------------------------------------------------------------
   Copyright 2019 Dave Peterson <dave@dspeterson.com>

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

     http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
   ----------------------------------------------------------------------------

   Implements <kvsyslog/conf/conf.h>.
 */

#include <kvsyslog/conf/conf.h>

#include <cassert>
#include <memory>
#include <unordered_map>
#include <utility>

#include <base/file_reader.h>
#include <base/no_default_case.h>
#include <kvsyslog/error.h>
#include <kvsyslog/level.h>
#include <kvsyslog/msg_format.h>
#include <xml/config/config_errors.h>
#include <xml/config/config_util.h>

using namespace xercesc;

using namespace Base;
using namespace KvSyslog;
using namespace KvSyslog::Conf;
using namespace Xml;
using namespace Xml::Config;

using TOpts = TAttrReader::TOpts;

namespace {

  /* Value of the "value" attribute of leaf element 'elem'. */
  std::string GetValue(const DOMElement &elem) {
    RequireLeaf(elem);
    return TAttrReader::GetString(elem, "value",
        TOpts::TRIM_WHITESPACE | TOpts::THROW_IF_EMPTY);
  }

  bool GetBoolValue(const DOMElement &elem) {
    RequireLeaf(elem);
    return TAttrReader::GetBool(elem, "value");
  }

  /* Apply 'parse' to 'value', reporting a TUnknownNameError as an invalid
     value for attribute 'attr_name' of 'elem'. */
  template <typename TParse>
  auto ParseName(const DOMElement &elem, const char *attr_name,
      const std::string &value, TParse parse) -> decltype(parse(value)) {
    try {
      return parse(value);
    } catch (const TUnknownNameError &x) {
      throw TInvalidAttr(elem, attr_name, value.c_str(), x.what());
    }
  }

  TFacility ParseFacility(const DOMElement &elem, const char *attr_name,
      const std::string &value) {
    return ParseName(elem, attr_name, value,
        [](const std::string &name) {
          return ToFacility(name);
        });
  }

  /* An element like <info level="notice" facility="local0" />. */
  TPriority GetPriorityValue(const DOMElement &elem) {
    RequireLeaf(elem);
    const std::string level_name = TAttrReader::GetString(elem, "level",
        TOpts::TRIM_WHITESPACE | TOpts::THROW_IF_EMPTY);
    const TLevel level = ParseName(elem, "level", level_name,
        [](const std::string &name) {
          return ToLevel(name);
        });
    const auto facility_name = TAttrReader::GetOptString(elem, "facility",
        TOpts::TRIM_WHITESPACE);

    if (facility_name && !facility_name->empty()) {
      return TPriority(level, ParseFacility(elem, "facility", *facility_name));
    }

    return TPriority(level);
  }

}  // namespace

TConf TConf::LoadFile(const std::string &path) {
  const std::string xml = ReadFileIntoString(path);
  return TBuilder().Build(xml);
}

TDrainBuilder TConf::MakeBuilder() const {
  assert(this);
  TDrainBuilder builder;
  builder.Facility(Facility);

  switch (Format) {
    case TFormatKind::Default: {
      builder.Format(std::make_shared<TDefaultMsgFormat>());
      break;
    }
    case TFormatKind::Basic: {
      builder.Format(std::make_shared<TBasicMsgFormat>());
      break;
    }
    NO_DEFAULT_CASE;
  }

  builder.Priority(std::make_shared<TConfiguredPriorityMapper>(Priority));

  if (Ident) {
    builder.Ident(*Ident);
  }

  if (LogPid) {
    builder.LogPid();
  }

  if (LogDelay) {
    if (*LogDelay) {
      builder.LogOdelay();
    } else {
      builder.LogNdelay();
    }
  }

  if (LogPerror) {
    builder.LogPerror();
  }

  if (Threshold) {
    builder.Threshold(*Threshold);
  }

  return builder;
}

TConf TConf::TBuilder::Build(const void *buf, size_t buf_size) {
  assert(this);
  assert(buf);
  BuildResult = TConf();
  TDomDocumentPtr doc = ParseXmlConfig(buf, buf_size, "US-ASCII");
  ProcessRootElem(GetRootElement(*doc, "kvsyslogConfig"));
  TConf result = std::move(BuildResult);
  BuildResult = TConf();
  return result;
}

void TConf::TBuilder::ProcessRootElem(const DOMElement &root) {
  assert(this);
  const auto subsection_map = GetSubsectionElements(root,
      {
          "format", "facility", "ident", "log_pid", "log_delay",
          "log_perror", "threshold", "priority"
      }, false);

  if (subsection_map.count("format")) {
    const DOMElement &elem = *subsection_map.at("format");
    const std::string value = GetValue(elem);

    if (value == "default") {
      BuildResult.Format = TFormatKind::Default;
    } else if (value == "basic") {
      BuildResult.Format = TFormatKind::Basic;
    } else {
      throw TInvalidAttr(elem, "value", value.c_str(),
          "Message format must be one of {default, basic}");
    }
  }

  if (subsection_map.count("facility")) {
    const DOMElement &elem = *subsection_map.at("facility");
    BuildResult.Facility = ParseFacility(elem, "value", GetValue(elem));
  }

  if (subsection_map.count("ident")) {
    const DOMElement &elem = *subsection_map.at("ident");
    RequireLeaf(elem);
    BuildResult.Ident = TAttrReader::GetString(elem, "value");
  }

  if (subsection_map.count("log_pid")) {
    BuildResult.LogPid = GetBoolValue(*subsection_map.at("log_pid"));
  }

  if (subsection_map.count("log_delay")) {
    BuildResult.LogDelay = GetBoolValue(*subsection_map.at("log_delay"));
  }

  if (subsection_map.count("log_perror")) {
    BuildResult.LogPerror = GetBoolValue(*subsection_map.at("log_perror"));
  }

  if (subsection_map.count("threshold")) {
    const DOMElement &elem = *subsection_map.at("threshold");
    BuildResult.Threshold = ParseName(elem, "value", GetValue(elem),
        [](const std::string &name) {
          return ToSeverity(name);
        });
  }

  if (subsection_map.count("priority")) {
    ProcessPriorityElem(*subsection_map.at("priority"));
  }
}

void TConf::TBuilder::ProcessPriorityElem(const DOMElement &priority_elem) {
  assert(this);
  const auto subsection_map = GetSubsectionElements(priority_elem,
      {"all", "trace", "debug", "info", "warning", "error", "critical"},
      false);
  TPriorityConfig &config = BuildResult.Priority;

  if (subsection_map.count("all")) {
    config.All = GetPriorityValue(*subsection_map.at("all"));
  }

  static const TSeverity severities[] = {
    TSeverity::Trace, TSeverity::Debug, TSeverity::Info, TSeverity::Warning,
    TSeverity::Error, TSeverity::Critical
  };

  for (TSeverity severity : severities) {
    auto iter = subsection_map.find(ToString(severity));

    if (iter != subsection_map.end()) {
      config.Get(severity) = GetPriorityValue(*iter->second);
    }
  }
}
