#ifndef __NG_TOOL__
#define __NG_TOOL__

#include "EditorClient.hpp"
#include "Headers.hpp"

namespace ng {
/** @brief Something an MCP client can call by name. */
class Tool {
 public:
  Tool(const string& _name, const string& _description,
       const json& _inputSchema)
      : name(_name), description(_description), inputSchema(_inputSchema) {}
  virtual ~Tool() {}

  const string& getName() const { return name; }
  const string& getDescription() const { return description; }
  const json& getInputSchema() const { return inputSchema; }

  /** @brief The entry advertised by tools/list. */
  json describe() const {
    return json{{"name", name},
                {"description", description},
                {"inputSchema", inputSchema}};
  }

 protected:
  string name;
  string description;
  json inputSchema;
};

/**
 * @brief A tool contributed by one connection. The same name may be exposed
 * by several connections, each with its own instance.
 */
class DynamicTool : public Tool {
 public:
  DynamicTool(const string& _name, const string& _description,
              const json& _inputSchema)
      : Tool(_name, _description, _inputSchema) {}
  virtual ~DynamicTool() {}

  /** @return An MCP tool result ({content, isError}). */
  virtual json call(shared_ptr<EditorClient> client,
                    const json& arguments) = 0;
};

/** @brief A tool that exists for the whole life of the gateway. */
class StaticTool : public Tool {
 public:
  typedef std::function<json(const json& arguments)> Handler;

  StaticTool(const string& _name, const string& _description,
             const json& _inputSchema, Handler _handler)
      : Tool(_name, _description, _inputSchema), handler(_handler) {}

  json call(const json& arguments) { return handler(arguments); }

 protected:
  Handler handler;
};

/** @brief Wraps `value` as a successful single text-content tool result. */
inline json textToolResult(const json& value) {
  return json{{"content", json::array({json{
                              {"type", "text"},
                              {"text", value.is_string() ? value.get<string>()
                                                         : value.dump()}}})},
              {"isError", false}};
}
}  // namespace ng

#endif  // __NG_TOOL__
