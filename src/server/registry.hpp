#ifndef ARBOR_SERVER_REGISTRY_HPP
#define ARBOR_SERVER_REGISTRY_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <session/session.hpp>

namespace arbor::server {
#include "macros_open.hpp"

  // Params that are well-formed JSON but out of range for the method.
  class ParamsError: public std::runtime_error {
  public:
    explicit ParamsError(std::string const& s):
        std::runtime_error(s) {}
  };

  // A method handler decodes its params, calls one session operation and encodes the result.
  // Throws `nlohmann::json::exception` or `ParamsError` if the params do not have the expected shape.
  using Handler = std::function<session::Result<nlohmann::json>(session::Operations&, nlohmann::json const&)>;
  using Registry = std::unordered_map<std::string, Handler>;

  // All methods of the protocol:
  //   step.apply      {nodeId, step, budget?}  -> {nodeId}
  //   state.goals     {nodeId}                 -> {goals: [{name?, hypotheses: [{name, type}], target}]}
  //   state.messages  {nodeId}                 -> {messages: [{severity, message}]}
  //   name.resolve    {nodeId, name}           -> {candidates: [{name, fields}]}
  //   expr.unify      {nodeId, lhs, rhs}       -> {unifier: null | {name: text | null}}
  //   state.new       {goals: [{name, type}]}  -> {nodeId}
  //   state.giveUp    {nodeId}                 -> {nodeId}
  //   commit          {nodeId}                 -> {}
  //   position        {}                       -> {position: null | {file, line, column}}
  //   node.info       {nodeId}                 -> {nodeId, parent, step}
  auto makeRegistry() -> Registry;

#include "macros_close.hpp"
}

#endif // ARBOR_SERVER_REGISTRY_HPP
