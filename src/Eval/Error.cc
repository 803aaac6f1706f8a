#include <mirv/Eval/Error.hh>

using namespace mirv;
using namespace mirv::eval;

auto eval::Name(AllocKind k) -> std::string_view {
    switch (k) {
        case AllocKind::Stack: return "stack";
        case AllocKind::Heap: return "heap";
        case AllocKind::Static: return "static";
        case AllocKind::Function: return "function";
    }
    Unreachable();
}

auto eval::Name(ResourceKind k) -> std::string_view {
    switch (k) {
        case ResourceKind::StepBudget: return "step budget";
        case ResourceKind::MemoryBudget: return "memory budget";
        case ResourceKind::StackDepth: return "stack depth";
    }
    Unreachable();
}

auto eval::Name(ViolationKind k) -> std::string_view {
    switch (k) {
        case ViolationKind::UseAfterFree: return "use after free";
        case ViolationKind::OutOfBounds: return "out-of-bounds access";
        case ViolationKind::Unaligned: return "misaligned access";
        case ViolationKind::UninitializedRead: return "read of uninitialised memory";
        case ViolationKind::InvalidDiscriminant: return "invalid enum discriminant";
        case ViolationKind::DoubleFree: return "double free";
        case ViolationKind::AllocationKindMismatch: return "deallocation with the wrong allocator";
        case ViolationKind::WriteToReadOnly: return "write to read-only memory";
        case ViolationKind::ReachedUnreachable: return "entered unreachable code";
        case ViolationKind::ProvenanceMismatch: return "access through a pointer without provenance";
        case ViolationKind::InvalidBool: return "invalid value for 'bool'";
        case ViolationKind::InvalidChar: return "invalid value for 'char'";
        case ViolationKind::PointerAsBytes: return "pointer bytes read as integer";
        case ViolationKind::DerefFunctionPointer: return "dereference of a function pointer";
        case ViolationKind::InvalidFunctionPointer: return "call through an invalid function pointer";
        case ViolationKind::ArithmeticOverflow: return "arithmetic overflow";
        case ViolationKind::InvalidDeallocation: return "invalid deallocation";
    }
    Unreachable();
}

auto EvalError::Abort(std::string message, bool unwinds) -> EvalError {
    EvalError e{Kind::Abort};
    e.message = std::move(message);
    e.unwinds = unwinds;
    return e;
}

auto EvalError::Exit(i64 code) -> EvalError {
    EvalError e{Kind::Exit};
    e.exit_code = code;
    return e;
}

auto EvalError::Internal(std::string message) -> EvalError {
    EvalError e{Kind::Internal};
    e.message = std::move(message);
    return e;
}

auto EvalError::Interrupted() -> EvalError {
    return EvalError{Kind::Interrupted};
}

auto EvalError::Resource(ResourceKind k, u64 used, u64 limit) -> EvalError {
    EvalError e{Kind::ResourceExhausted};
    e.resource = k;
    e.used = used;
    e.limit = limit;
    return e;
}

auto EvalError::UB(ViolationKind k, AllocId alloc, i64 offset, std::string message) -> EvalError {
    EvalError e{Kind::UndefinedBehaviour};
    e.violation = k;
    e.alloc = alloc;
    e.offset = offset;
    e.message = std::move(message);
    return e;
}

auto EvalError::str() const -> std::string {
    switch (kind) {
        case Kind::UndefinedBehaviour: {
            std::string s = std::format("Undefined behaviour: {}", Name(violation));
            if (alloc != 0) s += std::format(" (alloc{} at offset {})", alloc, offset);
            if (not message.empty()) s += std::format(": {}", message);
            return s;
        }

        case Kind::Abort:
            return std::format("Program aborted: {}", message);

        case Kind::ResourceExhausted:
            return std::format("Exceeded {} ({} of {})", Name(resource), used, limit);

        case Kind::Interrupted:
            return "Evaluation interrupted";

        case Kind::Internal:
            return std::format("Internal error: {}", message);

        case Kind::Exit:
            return std::format("Program exited with code {}", exit_code);
    }
    Unreachable();
}
