// lineage/registry/error.cpp - Error kind names and codes
#include "lineage/registry/error.hpp"

namespace lineage
{

std::string_view error_kind_to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::DuplicateRoot:
      return "DuplicateRootError";
    case ErrorKind::NonLinearChain:
      return "NonLinearChainError";
    case ErrorKind::VersionOrder:
      return "VersionOrderError";
    case ErrorKind::InvalidVersion:
      return "InvalidVersionError";
    case ErrorKind::RegistryFrozen:
      return "RegistryFrozenError";
    case ErrorKind::InvalidNode:
      return "InvalidNodeError";
    case ErrorKind::AliasOnChain:
      return "AliasOnChainError";
    case ErrorKind::VersionNotFound:
      return "VersionNotFoundError";
    case ErrorKind::NoPreviousVersion:
      return "NoPreviousVersionError";
    case ErrorKind::ModelNotFound:
      return "ModelNotFoundError";
    case ErrorKind::AmbiguousChain:
      return "AmbiguousChainError";
    case ErrorKind::UnboundHandler:
      return "UnboundHandlerError";
  }
  return "UnknownError";
}

std::string_view error_kind_code(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::DuplicateRoot:
      return "E101";
    case ErrorKind::NonLinearChain:
      return "E102";
    case ErrorKind::VersionOrder:
      return "E103";
    case ErrorKind::InvalidVersion:
      return "E104";
    case ErrorKind::RegistryFrozen:
      return "E105";
    case ErrorKind::InvalidNode:
      return "E106";
    case ErrorKind::AliasOnChain:
      return "E107";
    case ErrorKind::VersionNotFound:
      return "E201";
    case ErrorKind::NoPreviousVersion:
      return "E202";
    case ErrorKind::ModelNotFound:
      return "E203";
    case ErrorKind::AmbiguousChain:
      return "E204";
    case ErrorKind::UnboundHandler:
      return "E205";
  }
  return "E000";
}

Diagnostic to_diagnostic(const ResolveError & error)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = std::string(error_kind_code(error.kind));
  d.message = error.message;
  return d;
}

}  // namespace lineage
