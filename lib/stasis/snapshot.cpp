// Stasis: A resumable WebAssembly interpreter
// Copyright 2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#include "snapshot.hpp"
#include "execute.hpp"
#include "leb128.hpp"
#include "parser.hpp"
#include <algorithm>
#include <iterator>

namespace stasis
{
namespace
{
constexpr uint8_t snapshot_magic[]{'S', 'T', 'S', 'N'};
constexpr uint8_t store_image_magic[]{'S', 'T', 'S', 'I'};

[[noreturn]] void fail(const std::string& message)
{
    throw snapshot_error{message};
}

void put_u64(bytes& out, uint64_t value)
{
    out += leb128u_encode(value);
}

void put_fixed(bytes& out, uint64_t value, size_t size)
{
    for (size_t i = 0; i < size; ++i)
        out.push_back(static_cast<uint8_t>(value >> (8 * i)));
}

void put_bytes(bytes& out, bytes_view data)
{
    put_u64(out, data.size());
    out += data;
}

void put_string(bytes& out, const std::string& str)
{
    put_u64(out, str.size());
    std::copy(str.begin(), str.end(), std::back_inserter(out));
}

/// Numeric values are kept as fixed-width little-endian bit patterns, references as a null flag
/// followed by the address.
void put_value(bytes& out, const Value& value)
{
    out.push_back(static_cast<uint8_t>(value.type()));
    switch (value.type())
    {
    case ValType::i32:
    case ValType::f32:
        put_fixed(out, value.bits(), 4);
        break;
    case ValType::i64:
    case ValType::f64:
        put_fixed(out, value.bits(), 8);
        break;
    case ValType::funcref:
    case ValType::externref:
        if (value.is_null())
            out.push_back(0);
        else
        {
            out.push_back(1);
            put_u64(out, value.ref());
        }
        break;
    }
}

void put_values(bytes& out, const std::vector<Value>& values)
{
    put_u64(out, values.size());
    for (const auto& value : values)
        put_value(out, value);
}

void put_fingerprints(bytes& out, const std::vector<ModuleFingerprint>& modules)
{
    put_u64(out, modules.size());
    for (const auto& module : modules)
    {
        put_u64(out, module.module);
        put_fixed(out, module.fingerprint, 8);
    }
}

template <typename T>
void put_optional(bytes& out, const std::optional<T>& value, void (*put)(bytes&, const T&))
{
    if (!value.has_value())
    {
        out.push_back(0);
        return;
    }
    out.push_back(1);
    put(out, *value);
}

/// Reads the binary forms. All failures are reported as parser_error.
class Reader
{
    const uint8_t* m_pos;
    const uint8_t* const m_end;

public:
    explicit Reader(bytes_view input) noexcept : m_pos{input.data()}, m_end{input.data() + input.size()}
    {}

    bool at_end() const noexcept { return m_pos == m_end; }

    const uint8_t* position() const noexcept { return m_pos; }

    uint8_t byte()
    {
        uint8_t value;
        std::tie(value, m_pos) = parse_byte(m_pos, m_end);
        return value;
    }

    template <typename T>
    T leb()
    {
        T value;
        std::tie(value, m_pos) = leb128u_decode<T>(m_pos, m_end);
        return value;
    }

    uint64_t fixed(size_t size)
    {
        if (static_cast<size_t>(m_end - m_pos) < size)
            throw parser_error{m_end, "unexpected EOF"};
        uint64_t value = 0;
        for (size_t i = 0; i < size; ++i)
            value |= uint64_t{m_pos[i]} << (8 * i);
        m_pos += size;
        return value;
    }

    bytes raw()
    {
        const auto size = leb<uint64_t>();
        if (static_cast<uint64_t>(m_end - m_pos) < size)
            throw parser_error{m_end, "unexpected EOF"};
        bytes result(m_pos, static_cast<size_t>(size));
        m_pos += size;
        return result;
    }

    std::string string()
    {
        std::string value;
        std::tie(value, m_pos) = parse_string(m_pos, m_end);
        return value;
    }

    bool flag()
    {
        const auto value = byte();
        if (value > 1)
            throw parser_error{m_pos - 1, "invalid flag " + std::to_string(value)};
        return value == 1;
    }

    Value value()
    {
        const auto type_byte = byte();
        const auto type = static_cast<ValType>(type_byte);
        switch (type)
        {
        case ValType::i32:
        case ValType::f32:
            return Value::from_bits(type, fixed(4));
        case ValType::i64:
        case ValType::f64:
            return Value::from_bits(type, fixed(8));
        case ValType::funcref:
            return flag() ? Value::funcref(leb<uint32_t>()) : Value::null(type);
        case ValType::externref:
            return flag() ? Value::externref(leb<uint32_t>()) : Value::null(type);
        }
        throw parser_error{m_pos - 1, "invalid value type " + std::to_string(type_byte)};
    }

    std::vector<Value> values()
    {
        std::vector<Value> result;
        const auto count = leb<uint32_t>();
        for (uint32_t i = 0; i < count; ++i)
            result.push_back(value());
        return result;
    }

    std::vector<ModuleFingerprint> fingerprints()
    {
        std::vector<ModuleFingerprint> result;
        const auto count = leb<uint32_t>();
        for (uint32_t i = 0; i < count; ++i)
        {
            ModuleFingerprint module;
            module.module = leb<uint32_t>();
            module.fingerprint = fixed(8);
            result.push_back(module);
        }
        return result;
    }

    void magic(const uint8_t (&expected)[4])
    {
        for (const auto b : expected)
        {
            if (byte() != b)
                throw parser_error{m_pos - 1, "invalid magic"};
        }
    }
};

void put_host_call(bytes& out, const HostCall& call)
{
    put_u64(out, call.func);
    put_string(out, call.module);
    put_string(out, call.name);
    put_values(out, call.args);
}

void put_func_addr(bytes& out, const FuncAddr& addr)
{
    put_u64(out, addr);
}

void put_trap(bytes& out, const TrapKind& kind)
{
    out.push_back(static_cast<uint8_t>(kind));
}

void check_fingerprints(const std::vector<ModuleFingerprint>& modules, const Store& store)
{
    for (const auto& module : modules)
    {
        if (module.module >= store.modules.size())
            fail("unknown module instance " + std::to_string(module.module));
        if (store.modules[module.module].module->module().fingerprint != module.fingerprint)
            fail("module fingerprint mismatch for module instance " + std::to_string(module.module));
    }
}

/// Returns the sequence governed by the label nested in the parent, i.e. the body of
/// the structured instruction just before the parent's cursor.
const std::vector<Instr>& get_nested_sequence(
    const Module& module, const Label& parent, const LabelSnapshot& label)
{
    if (parent.cursor == 0 || parent.cursor > parent.instructions->size())
        fail("label nesting does not match the code");

    const auto& instr = (*parent.instructions)[parent.cursor - 1];
    const std::vector<Instr>* sequence = nullptr;
    switch (label.kind)
    {
    case LabelKind::block:
        if (instr.opcode == Opcode::block)
            sequence = &instr.body;
        break;
    case LabelKind::loop:
        if (instr.opcode == Opcode::loop)
            sequence = &instr.body;
        break;
    case LabelKind::if_then:
        if (instr.opcode == Opcode::if_)
            sequence = &instr.body;
        break;
    case LabelKind::if_else:
        if (instr.opcode == Opcode::if_)
            sequence = &instr.else_body;
        break;
    case LabelKind::function_body:
        break;
    }
    if (sequence == nullptr)
        fail("label nesting does not match the code");

    if (label.arity != get_label_arity(module, instr.block_type, label.kind))
        fail("label arity does not match the code");

    return *sequence;
}

Frame restore_frame(const FrameSnapshot& snapshot, const Store& store,
    const std::vector<ModuleFingerprint>& modules, size_t& min_height, size_t stack_size)
{
    const auto module_known = std::any_of(modules.begin(), modules.end(),
        [&snapshot](const auto& m) { return m.module == snapshot.module; });
    if (!module_known)
        fail("frame refers to module instance without fingerprint");

    if (snapshot.func >= store.funcs.size())
        fail("unknown function address " + std::to_string(snapshot.func));
    const auto& func = store.funcs[snapshot.func];
    if (func.is_host() || func.module != snapshot.module)
        fail("frame function does not belong to the module instance");

    if (snapshot.arity != func.type.outputs.size())
        fail("frame arity does not match the function type");

    const auto& inputs = func.type.inputs;
    const auto& declared = func.code->locals;
    if (snapshot.locals.size() != inputs.size() + declared.size())
        fail("frame locals do not match the function");
    for (size_t i = 0; i < snapshot.locals.size(); ++i)
    {
        const auto expected = i < inputs.size() ? inputs[i] : declared[i - inputs.size()];
        if (snapshot.locals[i].type() != expected)
            fail("frame local " + std::to_string(i) + " type mismatch");
    }

    if (snapshot.labels.empty() || snapshot.labels.front().kind != LabelKind::function_body)
        fail("frame must start with the function body label");

    const auto& module = store.modules[snapshot.module].module->module();

    Frame frame;
    frame.func = snapshot.func;
    frame.module = snapshot.module;
    frame.arity = snapshot.arity;
    frame.locals = snapshot.locals;

    for (const auto& label_snapshot : snapshot.labels)
    {
        Label label;
        label.kind = label_snapshot.kind;
        label.arity = label_snapshot.arity;
        label.cursor = label_snapshot.cursor;

        if (frame.labels.empty())
        {
            if (label.arity != frame.arity)
                fail("function body label arity does not match the function type");
            label.instructions = &func.code->body;
        }
        else
            label.instructions = &get_nested_sequence(module, frame.labels.back(), label_snapshot);

        if (label.cursor > label.instructions->size())
            fail("label cursor out of the instruction sequence");

        if (label_snapshot.height < min_height || label_snapshot.height > stack_size)
            fail("label height inconsistent with the value stack");
        label.height = static_cast<size_t>(label_snapshot.height);
        min_height = label.height;

        frame.labels.push_back(label);
    }
    return frame;
}

/// Function references must point into the target store.
void check_func_refs(
    const std::vector<Value>& values, const Store& store, const std::string& where)
{
    for (const auto& value : values)
    {
        if (value.type() == ValType::funcref && !value.is_null() &&
            value.ref() >= store.funcs.size())
        {
            fail("reference to unknown function " + std::to_string(value.ref()) + " in " +
                 where);
        }
    }
}

void check_store_shape(const StoreImage& image, const Store& store)
{
    if (image.format_version != SnapshotFormatVersion)
        fail("unsupported store image version " + std::to_string(image.format_version));
    if (image.modules.size() != store.modules.size())
        fail("store image module count mismatch");
    check_fingerprints(image.modules, store);

    if (image.function_count != store.funcs.size() || image.memories.size() != store.mems.size() ||
        image.tables.size() != store.tables.size() || image.globals.size() != store.globals.size() ||
        image.dropped_elems.size() != store.elems.size() ||
        image.dropped_datas.size() != store.datas.size())
        fail("store image does not match the store shape");
}
}  // namespace

Snapshot capture(const ExecutionState& state, const Store& store)
{
    Snapshot snapshot;
    snapshot.stack.assign(state.stack.begin(), state.stack.end());
    snapshot.entry = state.entry;
    snapshot.pending = state.pending;
    snapshot.trap = state.trap;
    snapshot.results = state.results;
    snapshot.steps = state.steps;

    for (const auto& frame : state.frames)
    {
        FrameSnapshot frame_snapshot;
        frame_snapshot.func = frame.func;
        frame_snapshot.module = frame.module;
        frame_snapshot.arity = frame.arity;
        frame_snapshot.locals = frame.locals;
        for (const auto& label : frame.labels)
            frame_snapshot.labels.push_back({label.kind, label.arity, label.height, label.cursor});
        snapshot.frames.push_back(std::move(frame_snapshot));

        const auto known = std::any_of(snapshot.modules.begin(), snapshot.modules.end(),
            [&frame](const auto& m) { return m.module == frame.module; });
        if (!known)
        {
            snapshot.modules.push_back(
                {frame.module, store.modules.at(frame.module).module->module().fingerprint});
        }
    }
    return snapshot;
}

ExecutionState restore(const Snapshot& snapshot, const Store& store)
{
    if (snapshot.format_version != SnapshotFormatVersion)
        fail("unsupported snapshot version " + std::to_string(snapshot.format_version));

    check_fingerprints(snapshot.modules, store);
    check_func_refs(snapshot.stack, store, "value stack");
    for (size_t i = 0; i < snapshot.frames.size(); ++i)
        check_func_refs(snapshot.frames[i].locals, store, "frame " + std::to_string(i) + " locals");
    if (snapshot.pending.has_value())
        check_func_refs(snapshot.pending->args, store, "pending call arguments");
    if (snapshot.results.has_value())
        check_func_refs(*snapshot.results, store, "results");

    ExecutionState state;
    for (const auto& value : snapshot.stack)
        state.stack.push(value);

    size_t min_height = 0;
    for (const auto& frame : snapshot.frames)
    {
        state.frames.push_back(
            restore_frame(frame, store, snapshot.modules, min_height, snapshot.stack.size()));
    }

    if (snapshot.entry.has_value() && *snapshot.entry >= store.funcs.size())
        fail("unknown entry function address " + std::to_string(*snapshot.entry));

    if (snapshot.pending.has_value())
    {
        const auto func = snapshot.pending->func;
        if (func >= store.funcs.size() || !store.funcs[func].is_host())
            fail("pending call does not refer to a host function");
    }

    const bool finished = snapshot.trap.has_value() || snapshot.results.has_value();
    if (state.frames.empty() && !finished)
        fail("running execution without frames");
    if (!state.frames.empty() && snapshot.results.has_value())
        fail("returned execution with active frames");

    state.entry = snapshot.entry;
    state.pending = snapshot.pending;
    state.trap = snapshot.trap;
    state.results = snapshot.results;
    state.steps = snapshot.steps;
    return state;
}

bytes encode_snapshot(const Snapshot& snapshot)
{
    bytes out(snapshot_magic, sizeof(snapshot_magic));
    put_u64(out, snapshot.format_version);
    put_u64(out, snapshot.steps);
    put_fingerprints(out, snapshot.modules);
    put_values(out, snapshot.stack);

    put_u64(out, snapshot.frames.size());
    for (const auto& frame : snapshot.frames)
    {
        put_u64(out, frame.func);
        put_u64(out, frame.module);
        put_u64(out, frame.arity);
        put_values(out, frame.locals);
        put_u64(out, frame.labels.size());
        for (const auto& label : frame.labels)
        {
            out.push_back(static_cast<uint8_t>(label.kind));
            put_u64(out, label.arity);
            put_u64(out, label.height);
            put_u64(out, label.cursor);
        }
    }

    put_optional(out, snapshot.entry, put_func_addr);
    put_optional(out, snapshot.pending, put_host_call);
    put_optional(out, snapshot.trap, put_trap);
    put_optional(out, snapshot.results, put_values);
    return out;
}

Snapshot decode_snapshot(bytes_view input)
{
    try
    {
        Reader reader{input};
        reader.magic(snapshot_magic);

        Snapshot snapshot;
        snapshot.format_version = reader.leb<uint32_t>();
        if (snapshot.format_version != SnapshotFormatVersion)
            fail("unsupported snapshot version " + std::to_string(snapshot.format_version));

        snapshot.steps = reader.leb<uint64_t>();
        snapshot.modules = reader.fingerprints();
        snapshot.stack = reader.values();

        const auto frame_count = reader.leb<uint32_t>();
        for (uint32_t i = 0; i < frame_count; ++i)
        {
            FrameSnapshot frame;
            frame.func = reader.leb<uint32_t>();
            frame.module = reader.leb<uint32_t>();
            frame.arity = reader.leb<uint32_t>();
            frame.locals = reader.values();
            const auto label_count = reader.leb<uint32_t>();
            for (uint32_t j = 0; j < label_count; ++j)
            {
                LabelSnapshot label;
                const auto kind = reader.byte();
                if (kind > static_cast<uint8_t>(LabelKind::if_else))
                    throw parser_error{reader.position() - 1, "invalid label kind"};
                label.kind = static_cast<LabelKind>(kind);
                label.arity = reader.leb<uint32_t>();
                label.height = reader.leb<uint64_t>();
                label.cursor = reader.leb<uint32_t>();
                frame.labels.push_back(label);
            }
            snapshot.frames.push_back(std::move(frame));
        }

        if (reader.flag())
            snapshot.entry = reader.leb<uint32_t>();
        if (reader.flag())
        {
            HostCall call;
            call.func = reader.leb<uint32_t>();
            call.module = reader.string();
            call.name = reader.string();
            call.args = reader.values();
            snapshot.pending = std::move(call);
        }
        if (reader.flag())
        {
            const auto kind = reader.byte();
            if (kind > static_cast<uint8_t>(TrapKind::host))
                throw parser_error{reader.position() - 1, "invalid trap kind"};
            snapshot.trap = static_cast<TrapKind>(kind);
        }
        if (reader.flag())
            snapshot.results = reader.values();

        if (!reader.at_end())
            throw parser_error{reader.position(), "unexpected bytes after the snapshot"};
        return snapshot;
    }
    catch (const parser_error& e)
    {
        throw snapshot_error{std::string{"malformed snapshot: "} + e.what()};
    }
}

StoreImage capture_store(const Store& store)
{
    StoreImage image;
    for (size_t i = 0; i < store.modules.size(); ++i)
    {
        image.modules.push_back(
            {static_cast<ModuleAddr>(i), store.modules[i].module->module().fingerprint});
    }
    image.function_count = static_cast<uint32_t>(store.funcs.size());
    for (const auto& memory : store.mems)
        image.memories.push_back(memory.data);
    for (const auto& table : store.tables)
        image.tables.push_back(table.elements);
    for (const auto& global : store.globals)
        image.globals.push_back(global.value);
    for (const auto& elem : store.elems)
        image.dropped_elems.push_back(elem.elements.empty());
    for (const auto& data : store.datas)
        image.dropped_datas.push_back(data.data.empty());
    return image;
}

void restore_store(const StoreImage& image, Store& store)
{
    check_store_shape(image, store);

    // Check everything before modifying the store.
    for (size_t i = 0; i < image.memories.size(); ++i)
    {
        const auto& data = image.memories[i];
        const auto& memory = store.mems[i];
        if (data.size() % PageSize != 0)
            fail("memory " + std::to_string(i) + " size is not a multiple of the page size");
        const auto pages = data.size() / PageSize;
        if (pages < memory.pages() || pages > memory.pages_limit ||
            (memory.max.has_value() && pages > *memory.max))
            fail("memory " + std::to_string(i) + " size does not fit the memory limits");
    }
    for (size_t i = 0; i < image.tables.size(); ++i)
    {
        const auto& elements = image.tables[i];
        const auto& table = store.tables[i];
        if (elements.size() < table.elements.size() ||
            (table.max.has_value() && elements.size() > *table.max))
            fail("table " + std::to_string(i) + " size does not fit the table limits");
        for (const auto& element : elements)
        {
            if (element.type() != table.elem_type)
                fail("table " + std::to_string(i) + " element type mismatch");
        }
        check_func_refs(elements, store, "table " + std::to_string(i));
    }
    for (size_t i = 0; i < image.globals.size(); ++i)
    {
        if (image.globals[i].type() != store.globals[i].type.value_type)
            fail("global " + std::to_string(i) + " type mismatch");
    }
    check_func_refs(image.globals, store, "globals");

    for (size_t i = 0; i < image.memories.size(); ++i)
        store.mems[i].data = image.memories[i];
    for (size_t i = 0; i < image.tables.size(); ++i)
        store.tables[i].elements = image.tables[i];
    for (size_t i = 0; i < image.globals.size(); ++i)
        store.globals[i].value = image.globals[i];
    for (size_t i = 0; i < image.dropped_elems.size(); ++i)
    {
        if (image.dropped_elems[i])
            store.elems[i].elements.clear();
    }
    for (size_t i = 0; i < image.dropped_datas.size(); ++i)
    {
        if (image.dropped_datas[i])
            store.datas[i].data.clear();
    }
}

bytes encode_store_image(const StoreImage& image)
{
    bytes out(store_image_magic, sizeof(store_image_magic));
    put_u64(out, image.format_version);
    put_fingerprints(out, image.modules);
    put_u64(out, image.function_count);

    put_u64(out, image.memories.size());
    for (const auto& memory : image.memories)
        put_bytes(out, memory);

    put_u64(out, image.tables.size());
    for (const auto& table : image.tables)
        put_values(out, table);

    put_values(out, image.globals);

    put_u64(out, image.dropped_elems.size());
    for (const auto dropped : image.dropped_elems)
        out.push_back(dropped ? 1 : 0);
    put_u64(out, image.dropped_datas.size());
    for (const auto dropped : image.dropped_datas)
        out.push_back(dropped ? 1 : 0);
    return out;
}

StoreImage decode_store_image(bytes_view input)
{
    try
    {
        Reader reader{input};
        reader.magic(store_image_magic);

        StoreImage image;
        image.format_version = reader.leb<uint32_t>();
        if (image.format_version != SnapshotFormatVersion)
            fail("unsupported store image version " + std::to_string(image.format_version));

        image.modules = reader.fingerprints();
        image.function_count = reader.leb<uint32_t>();

        const auto memory_count = reader.leb<uint32_t>();
        for (uint32_t i = 0; i < memory_count; ++i)
            image.memories.push_back(reader.raw());

        const auto table_count = reader.leb<uint32_t>();
        for (uint32_t i = 0; i < table_count; ++i)
            image.tables.push_back(reader.values());

        image.globals = reader.values();

        const auto elem_count = reader.leb<uint32_t>();
        for (uint32_t i = 0; i < elem_count; ++i)
            image.dropped_elems.push_back(reader.flag());
        const auto data_count = reader.leb<uint32_t>();
        for (uint32_t i = 0; i < data_count; ++i)
            image.dropped_datas.push_back(reader.flag());

        if (!reader.at_end())
            throw parser_error{reader.position(), "unexpected bytes after the store image"};
        return image;
    }
    catch (const parser_error& e)
    {
        throw snapshot_error{std::string{"malformed store image: "} + e.what()};
    }
}
}  // namespace stasis
