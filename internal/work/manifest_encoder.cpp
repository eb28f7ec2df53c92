#include "internal/work/manifest_encoder.hpp"

#include <google/protobuf/util/json_util.h>

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace workbundle::work {

namespace {

template <typename T>
void Validate(const T& object) {
  constexpr auto expected = ObjectTraits<T>::kKind;

  if (object.kind().empty()) {
    throw util::EncodeError(std::string(expected) + " object has no kind");
  }
  if (object.kind() != expected) {
    throw util::EncodeError("kind " + object.kind() + " does not match object type " + std::string(expected));
  }
  if (object.api_version().empty()) {
    throw util::EncodeError(std::string(expected) + " object has no apiVersion");
  }
  if (object.metadata().name().empty()) {
    throw util::EncodeError(std::string(expected) + " object has no metadata.name");
  }
}

template <typename T>
Object ParseAs(const workbundle::v1::Manifest& manifest) {
  T                                        object;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(manifest.raw(), &object, options);
  if (!status.ok()) {
    throw util::DecodeError("failed to decode " + manifest.kind() + " manifest: " + std::string(status.message()));
  }
  return object;
}

template <std::size_t... I>
Object DecodeByKind(const workbundle::v1::Manifest& manifest, std::index_sequence<I...>) {
  using Parser            = Object (*)(const workbundle::v1::Manifest&);
  constexpr Parser parsers[] = {&ParseAs<std::variant_alternative_t<I, Object>>...};
  constexpr std::string_view kinds[] = {ObjectTraits<std::variant_alternative_t<I, Object>>::kKind...};

  for (std::size_t i = 0; i < sizeof...(I); ++i) {
    if (manifest.kind() == kinds[i]) {
      return parsers[i](manifest);
    }
  }
  throw util::DecodeError("unknown manifest kind '" + manifest.kind() + "'");
}

} // namespace

std::string_view KindOf(const Object& object) {
  return std::visit([](const auto& o) -> std::string_view { return o.kind(); }, object);
}

workbundle::v1::Manifest Encode(const Object& object) {
  return std::visit(
      [](const auto& o) {
        Validate(o);

        std::string json;
        auto        status = google::protobuf::util::MessageToJsonString(o, &json);
        if (!status.ok()) {
          throw util::EncodeError("failed to marshal " + o.kind() + " " + o.metadata().name() + " to JSON: " +
                                  std::string(status.message()));
        }

        workbundle::v1::Manifest manifest;
        manifest.set_kind(o.kind());
        manifest.set_api_version(o.api_version());
        manifest.set_raw(std::move(json));
        return manifest;
      },
      object);
}

std::vector<workbundle::v1::Manifest> EncodeAll(const std::vector<Object>& objects) {
  std::vector<workbundle::v1::Manifest> manifests;
  manifests.reserve(objects.size());
  for (const auto& object : objects) {
    manifests.push_back(Encode(object));
  }
  return manifests;
}

Object Decode(const workbundle::v1::Manifest& manifest) {
  return DecodeByKind(manifest, std::make_index_sequence<std::variant_size_v<Object>>{});
}

} // namespace workbundle::work
