#pragma once

#include <csb/api.hpp>
#include <csb/cs_code.hpp>
#include <csb/type_map.hpp>

#include <string>
#include <vector>

namespace csb {

  struct codegen_options {
    std::string root_namespace = "Api";
    std::string runtime_namespace = "Api.Runtime";
    std::string tool_name = "csb";
  };

  // Produces one cs_file per struct and union of a resolved api, in
  // namespace order then declaration order.
  class codegen {
    const api& api_;
    const type_map& types_;
    codegen_options options_;

  public:
    codegen(const api& model, const type_map& types,
            codegen_options options = {});

    std::vector<cs_file>
    generate() const;

    // Documentation for the root namespace and every model namespace,
    // written beside the sources as namespace_summaries.xml.
    cs_doc_file
    namespace_summaries() const;
  };

} // namespace csb
