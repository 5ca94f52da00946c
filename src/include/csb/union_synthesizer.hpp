#pragma once

#include <csb/constraints.hpp>
#include <csb/cs_code.hpp>
#include <csb/synthesis_context.hpp>
#include <csb/wire_codec.hpp>

#include <string>
#include <vector>

namespace csb {

  // Builds the class for one union: a base class with variant accessors and
  // tag dispatch, and one nested sealed class per variant.
  class union_synthesizer {
    synthesis_context ctx_;
    constraint_compiler constraints_;
    wire_codec codec_;

  public:
    explicit union_synthesizer(const synthesis_context& ctx);

    // Variant names shadow same-named types inside the generated class, so
    // type references there, the union's own included, are resolved in a
    // scope holding them.
    cs_class
    synthesize(const union_type& u, const mapping_context& mapping);

  private:
    // Names used while rendering one union. self is how the union is
    // referenced from inside its own body; classes parallels the fields.
    struct union_names {
      std::string class_name;
      std::string self;
      std::vector<std::string> variants;
      std::vector<std::string> classes;

      const std::string&
      class_of(const std::string& variant_name, const union_type& u) const;
    };

    cs_method
    encoder(const union_type& u, const union_names& n);

    cs_method
    decoder(const union_type& u, const union_names& n,
            const mapping_context& scope);

    cs_class
    variant_class(const union_field& v, const std::string& class_name,
                  const union_names& n, const mapping_context& scope);
  };

} // namespace csb
