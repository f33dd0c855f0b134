#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace trafficviz {

// Root of every error raised by the library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A network or scenario resource does not exist.
class ResourceNotFound : public Error {
public:
  using Error::Error;
};

// The network description is not well-formed or lacks structural fields.
class MalformedTopology : public Error {
public:
  using Error::Error;
};

// The external engine session could not be opened (or was lost).
class EngineUnavailable : public Error {
public:
  using Error::Error;
};

// A per-entity attribute query failed. Recovered by skipping that entity.
class EntityLookupFailure : public Error {
public:
  EntityLookupFailure(std::string entity_id, const std::string& what)
    : Error(what), entity_id_(std::move(entity_id)) {}
  const std::string& entity_id() const { return entity_id_; }
private:
  std::string entity_id_;
};

} // namespace trafficviz
