#include "model/declaration.hpp"

namespace sfg::model {

auto collection_kind_for(std::string_view name) -> CollectionKind {
    if (name == "List")
        return CollectionKind::List;
    if (name == "Map")
        return CollectionKind::Map;
    if (name == "Set")
        return CollectionKind::Set;
    return CollectionKind::None;
}

auto TypeDescriptor::to_dart() const -> std::string {
    switch (shape) {
    case TypeShape::Inferred:
        return "dynamic";
    case TypeShape::Function:
    case TypeShape::Record: {
        if (nullable && (spelling.empty() || spelling.back() != '?')) {
            return spelling + "?";
        }
        return spelling;
    }
    case TypeShape::Named:
        break;
    }

    std::string out = name;
    if (!args.empty()) {
        out += "<";
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += args[i].to_dart();
        }
        out += ">";
    }
    if (nullable) {
        out += "?";
    }
    return out;
}

auto TypeDescriptor::non_nullable() const -> TypeDescriptor {
    TypeDescriptor copy = *this;
    copy.nullable = false;
    if ((shape == TypeShape::Function || shape == TypeShape::Record) && !copy.spelling.empty() &&
        copy.spelling.back() == '?') {
        copy.spelling.pop_back();
    }
    return copy;
}

auto TypeDescriptor::as_nullable() const -> TypeDescriptor {
    TypeDescriptor copy = *this;
    if (!accepts_null()) {
        copy.nullable = true;
    }
    return copy;
}

auto TypeDescriptor::accepts_null() const -> bool {
    if (nullable || shape == TypeShape::Inferred) {
        return true;
    }
    return shape == TypeShape::Named && (name == "dynamic" || name == "Null" || name == "void");
}

auto TypeDescriptor::named(std::string name, std::vector<TypeDescriptor> args, bool nullable)
    -> TypeDescriptor {
    TypeDescriptor t;
    t.collection = collection_kind_for(name);
    t.name = std::move(name);
    t.args = std::move(args);
    t.nullable = nullable;
    return t;
}

auto TypeDescriptor::inferred() -> TypeDescriptor {
    TypeDescriptor t;
    t.name = "dynamic";
    t.shape = TypeShape::Inferred;
    return t;
}

} // namespace sfg::model
