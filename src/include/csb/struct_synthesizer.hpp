#pragma once

#include <csb/constraints.hpp>
#include <csb/cs_code.hpp>
#include <csb/synthesis_context.hpp>
#include <csb/wire_codec.hpp>

#include <vector>

namespace csb {

  // Builds the class for one struct: constructors with validation, subtype
  // accessors, properties, and tag-aware encode/decode.
  class struct_synthesizer {
    synthesis_context ctx_;
    constraint_compiler constraints_;
    wire_codec codec_;

  public:
    explicit struct_synthesizer(const synthesis_context& ctx);

    cs_class
    synthesize(const struct_type& s, const mapping_context& mapping);

    // Constructor argument order: fields without a default and not
    // nullable first, the rest after, each group in declaration order.
    static std::vector<field>
    parameter_order(std::vector<field> fields);

  private:
    cs_constructor
    init_constructor(const struct_type& s, const std::string& class_name,
                     const struct_type* parent,
                     const std::vector<field>& own,
                     const mapping_context& mapping);

    cs_constructor
    default_constructor(const std::string& class_name,
                        const std::vector<field>& own,
                        const mapping_context& mapping);

    void
    add_subtype_accessors(cs_class& cls, const struct_type& s,
                          const mapping_context& mapping);

    cs_method
    encoder(const struct_type& s, const std::string& class_name,
            const mapping_context& mapping);

    cs_method
    decoder(const struct_type& s, const std::string& class_name,
            const mapping_context& mapping);

    // Is/As accessor suffix for a family member.
    std::string
    member_name(const family_member& m);
  };

} // namespace csb
