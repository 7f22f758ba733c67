//
// Described structs -> boost::json, for small JSON payloads produced by the runtime and plugins.
//

#ifndef PLUGRT_FRAMEWORK_DTO_TAGINVOKE_HPP
#define PLUGRT_FRAMEWORK_DTO_TAGINVOKE_HPP

#include <boost/json.hpp>
#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <string>
#include <type_traits>

namespace plugrt::framework::dto
{
  namespace desc = boost::describe;
  namespace mp11 = boost::mp11;

  // Found through ADL for every described struct declared in plugrt::framework::dto.
  template <class T>
  auto tag_invoke(boost::json::value_from_tag, boost::json::value& jv, T const& t)
    -> std::enable_if_t<desc::has_describe_members<T>::value>
  {
    auto& obj = jv.emplace_object();

    using Md = desc::describe_members<T, desc::mod_public>;

    mp11::mp_for_each<Md>([&](auto D)
    {
      obj.emplace(D.name, boost::json::value_from(t.*D.pointer));
    });
  }

  template <class T>
  std::string to_json(T const& t)
  {
    return boost::json::serialize(boost::json::value_from(t));
  }

  // Body of a synthesized error response: {"error": "...", "plugin": "...", "stage": "..."}
  struct ErrorBody
  {
    std::string error;
    std::string plugin;
    std::string stage;
  };

  BOOST_DESCRIBE_STRUCT(ErrorBody, (), (error, plugin, stage))
} // namespace plugrt::framework::dto

#endif //PLUGRT_FRAMEWORK_DTO_TAGINVOKE_HPP
