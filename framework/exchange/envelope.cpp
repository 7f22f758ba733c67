// framework/exchange/envelope.cpp
#include "envelope.hpp"
#include "exception/errors.hpp"

#include <boost/url/parse.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <iterator>

namespace plugrt::framework
{
  namespace http = boost::beast::http;

  std::string_view to_string(Stage stage)
  {
    switch (stage)
    {
    case Stage::Request:
      return "REQUEST";
    case Stage::Response:
      return "RESPONSE";
    }
    return "UNKNOWN";
  }

  HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init)
  {
    for (const auto& [name, value] : init)
    {
      add(name, value);
    }
  }

  std::vector<HeaderMap::Entry>::iterator HeaderMap::find(boost::beast::string_view name)
  {
    return std::find_if(entries_.begin(), entries_.end(), [name](const Entry& entry)
    {
      return boost::beast::iequals(entry.first, name);
    });
  }

  std::vector<HeaderMap::Entry>::const_iterator HeaderMap::find(boost::beast::string_view name) const
  {
    return std::find_if(entries_.begin(), entries_.end(), [name](const Entry& entry)
    {
      return boost::beast::iequals(entry.first, name);
    });
  }

  void HeaderMap::add(boost::beast::string_view name, std::string value)
  {
    if (auto it = find(name); it != entries_.end())
    {
      it->second.push_back(std::move(value));
      return;
    }
    entries_.emplace_back(std::string(name.data(), name.size()), Values{std::move(value)});
  }

  void HeaderMap::add(http::field name, std::string value)
  {
    add(http::to_string(name), std::move(value));
  }

  void HeaderMap::set(boost::beast::string_view name, std::string value)
  {
    if (auto it = find(name); it != entries_.end())
    {
      it->second = Values{std::move(value)};
      // later entries under the same name would still be sent
      entries_.erase(std::remove_if(std::next(it), entries_.end(), [name](const Entry& entry)
      {
        return boost::beast::iequals(entry.first, name);
      }), entries_.end());
      return;
    }
    entries_.emplace_back(std::string(name.data(), name.size()), Values{std::move(value)});
  }

  void HeaderMap::set(http::field name, std::string value)
  {
    set(http::to_string(name), std::move(value));
  }

  bool HeaderMap::erase(boost::beast::string_view name)
  {
    const auto before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [name](const Entry& entry)
    {
      return boost::beast::iequals(entry.first, name);
    }), entries_.end());
    return entries_.size() != before;
  }

  bool HeaderMap::contains(boost::beast::string_view name) const
  {
    return find(name) != entries_.end();
  }

  std::optional<std::string> HeaderMap::get(boost::beast::string_view name) const
  {
    if (auto it = find(name); it != entries_.end() && !it->second.empty())
    {
      return it->second.front();
    }
    return std::nullopt;
  }

  std::optional<std::string> HeaderMap::get(http::field name) const
  {
    return get(http::to_string(name));
  }

  std::optional<HeaderMap::Values> HeaderMap::get_all(boost::beast::string_view name) const
  {
    std::optional<Values> values;
    for (const auto& entry : entries_)
    {
      if (boost::beast::iequals(entry.first, name))
      {
        if (!values)
        {
          values.emplace();
        }
        values->insert(values->end(), entry.second.begin(), entry.second.end());
      }
    }
    return values;
  }

  void HeaderMap::append_entry(std::string name, Values values)
  {
    // 保持线上收到的原样：同名（大小写不同）的条目不合并
    entries_.emplace_back(std::move(name), std::move(values));
  }

  Envelope Envelope::request(std::string method, std::string url)
  {
    Envelope envelope;
    envelope.stage = Stage::Request;
    envelope.method = std::move(method);
    envelope.url = std::move(url);
    return envelope;
  }

  Envelope Envelope::response(int status_code)
  {
    Envelope envelope;
    envelope.stage = Stage::Response;
    envelope.status_code = status_code;
    return envelope;
  }

  std::string Envelope::path() const
  {
    if (!url)
    {
      return {};
    }
    auto parsed = boost::urls::parse_uri_reference(*url);
    if (!parsed)
    {
      return {};
    }
    return parsed->path();
  }

  bool Envelope::operator==(const Envelope& other) const
  {
    return stage == other.stage &&
      method == other.method &&
      url == other.url &&
      status_code == other.status_code &&
      headers == other.headers &&
      body == other.body &&
      metadata == other.metadata &&
      remote_addr == other.remote_addr;
  }

  bool is_valid_status(int code)
  {
    return code >= 100 && code <= 599;
  }

  void validate_envelope(const Envelope& envelope)
  {
    switch (envelope.stage)
    {
    case Stage::Request:
      if (!envelope.method || envelope.method->empty())
      {
        throw ProtocolError("REQUEST envelope is missing method");
      }
      if (!envelope.url)
      {
        throw ProtocolError("REQUEST envelope is missing url");
      }
      if (auto parsed = boost::urls::parse_uri_reference(*envelope.url); !parsed)
      {
        throw ProtocolError(fmt::format("REQUEST envelope url '{}' is malformed: {}", *envelope.url,
                                        parsed.error().message()));
      }
      break;
    case Stage::Response:
      if (!envelope.status_code)
      {
        throw ProtocolError("RESPONSE envelope is missing status_code");
      }
      if (!is_valid_status(*envelope.status_code))
      {
        throw ProtocolError(fmt::format("RESPONSE envelope status_code {} is outside 100-599",
                                        *envelope.status_code));
      }
      break;
    }

    for (const auto& [name, values] : envelope.headers)
    {
      if (name.empty())
      {
        throw ProtocolError("envelope carries a header with an empty name");
      }
    }
  }
}
