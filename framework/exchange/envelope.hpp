// framework/exchange/envelope.hpp
#ifndef PLUGRT_FRAMEWORK_EXCHANGE_ENVELOPE_HPP_
#define PLUGRT_FRAMEWORK_EXCHANGE_ENVELOPE_HPP_

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/field.hpp>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plugrt::framework
{
  enum class Stage
  {
    Request,
    Response
  };

  std::string_view to_string(Stage stage);

  /**
   * @brief Ordered, multi-valued HTTP header collection.
   *
   * Names are matched case-insensitively. The order in which names were first added,
   * and the order of values under each name, is preserved exactly. add() and set()
   * keep one entry per name; entries taken from the wire may repeat a name in
   * another spelling and are kept separate.
   */
  class HeaderMap
  {
  public:
    using Values = std::vector<std::string>;
    using Entry = std::pair<std::string, Values>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<std::pair<std::string, std::string>> init);

    // Appends a value, creating the entry at the end if the name is new.
    void add(boost::beast::string_view name, std::string value);
    void add(boost::beast::http::field name, std::string value);

    // Replaces the values of the first matching entry in place and drops any later
    // entry with the same name, or appends a new entry.
    void set(boost::beast::string_view name, std::string value);
    void set(boost::beast::http::field name, std::string value);

    // Removes every entry with this name.
    bool erase(boost::beast::string_view name);
    bool contains(boost::beast::string_view name) const;

    std::optional<std::string> get(boost::beast::string_view name) const;
    std::optional<std::string> get(boost::beast::http::field name) const;
    // Values of every entry with this name, in entry order.
    std::optional<Values> get_all(boost::beast::string_view name) const;

    // Appends a separate entry even if the name is already present, so headers
    // decoded from the wire keep the entries and spelling they arrived with.
    void append_entry(std::string name, Values values);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const HeaderMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const HeaderMap& other) const { return !(*this == other); }

  private:
    std::vector<Entry>::iterator find(boost::beast::string_view name);
    std::vector<Entry>::const_iterator find(boost::beast::string_view name) const;

    std::vector<Entry> entries_;
  };

  /**
   * @brief One intercepted HTTP message at a given stage.
   *
   * method/url only apply to Stage::Request, status_code only to Stage::Response.
   * Presence is explicit: a field that was never sent stays std::nullopt.
   */
  struct Envelope
  {
    Stage stage = Stage::Request;
    std::optional<std::string> method;
    std::optional<std::string> url;
    std::optional<int> status_code;
    HeaderMap headers;
    std::string body;
    std::map<std::string, std::string> metadata;
    std::optional<std::string> remote_addr;

    static Envelope request(std::string method, std::string url);
    static Envelope response(int status_code);

    // Path component of url, empty if url is absent or unparseable.
    std::string path() const;

    std::optional<std::string> get_header(boost::beast::string_view name) const { return headers.get(name); }
    std::optional<std::string> get_header(boost::beast::http::field name) const { return headers.get(name); }

    bool operator==(const Envelope& other) const;
    bool operator!=(const Envelope& other) const { return !(*this == other); }
  };

  bool is_valid_status(int code);

  /**
   * @brief Checks an envelope against the rules of its stage.
   * @throws ProtocolError when a required field is missing or malformed.
   */
  void validate_envelope(const Envelope& envelope);
}

#endif // PLUGRT_FRAMEWORK_EXCHANGE_ENVELOPE_HPP_
