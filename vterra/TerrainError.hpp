#pragma once
#include <stdexcept>
#include <string>

namespace vterra
{

/**
 * \brief Base class of all failures raised while building a terrain.
 *
 * A build either produces a complete terrain or throws one of the derived types below. Nothing is retried, the
 * computation is deterministic given its inputs.
 */
class TerrainError : public std::runtime_error
{
 public:
  enum class Kind
  {
    InvalidInput, // caller supplied sites or configuration that cannot be tessellated
    TopologyInconsistency, // cells violate the winding or sharing rules of a planar decomposition
    DependencyFailure // the tessellation or noise capability failed or broke its contract
  };

  TerrainError(Kind kind, const std::string& message)
    : std::runtime_error(message)
    , error_kind(kind)
  {
  }

  Kind kind() const noexcept { return error_kind; }

 private:
  Kind error_kind;
};

inline const char* toString(TerrainError::Kind kind)
{
  switch (kind)
  {
  case TerrainError::Kind::InvalidInput:
    return "InvalidInput";
  case TerrainError::Kind::TopologyInconsistency:
    return "TopologyInconsistency";
  case TerrainError::Kind::DependencyFailure:
    return "DependencyFailure";
  }
  return "Unknown";
}

class InvalidInputError : public TerrainError
{
 public:
  explicit InvalidInputError(const std::string& message)
    : TerrainError(Kind::InvalidInput, message)
  {
  }
};

class TopologyInconsistencyError : public TerrainError
{
 public:
  explicit TopologyInconsistencyError(const std::string& message)
    : TerrainError(Kind::TopologyInconsistency, message)
  {
  }
};

class DependencyFailureError : public TerrainError
{
 public:
  explicit DependencyFailureError(const std::string& message)
    : TerrainError(Kind::DependencyFailure, message)
  {
  }
};
}
