// Lumen - WGSL shader variants

#include <lumen/shaders.h>
#include <utility>

namespace lumen {

namespace shaders {

// Shared uniform structs. Layouts match gpu_structs.h.
const char* UNIFORM_STRUCTS = R"(
struct LightUniform {
    direction: vec4f,
    color: vec4f,
    ambient: vec4f,
}

struct ModelUniform {
    model: mat4x4f,
}

struct MaterialUniform {
    baseColor: vec4f,
    factors: vec4f,  // ambient, specular, shininess, normal scale
}

@group(1) @binding(0) var<uniform> light: LightUniform;
@group(2) @binding(0) var<uniform> transform: ModelUniform;
@group(3) @binding(0) var<uniform> material: MaterialUniform;
)";

const char* CAMERA_MONO = R"(
struct CameraUniform {
    viewProjection: mat4x4f,
    view: mat4x4f,
    projection: mat4x4f,
    position: vec4f,
}

@group(0) @binding(0) var<uniform> camera: CameraUniform;
)";

// Arrays are [left, right]; the eye index arrives per output layer
const char* CAMERA_STEREO = R"(
struct CameraUniform {
    view: array<mat4x4f, 2>,
    projection: array<mat4x4f, 2>,
    viewProjection: array<mat4x4f, 2>,
    eyePosition: array<vec4f, 2>,
}

@group(0) @binding(0) var<uniform> camera: CameraUniform;
)";

const char* DIFFUSE_BINDINGS = R"(
@group(3) @binding(1) var diffuseTexture: texture_2d<f32>;
@group(3) @binding(2) var diffuseSampler: sampler;
)";

const char* NORMAL_BINDINGS = R"(
@group(3) @binding(3) var normalTexture: texture_2d<f32>;
@group(3) @binding(4) var normalSampler: sampler;
)";

const char* LIGHTING = R"(
fn shade(albedo: vec4f, n: vec3f, worldPosition: vec3f, eyePosition: vec3f) -> vec4f {
    let l = normalize(-light.direction.xyz);
    let v = normalize(eyePosition - worldPosition);
    let h = normalize(l + v);
    let diffuse = max(dot(n, l), 0.0);
    let specular = pow(max(dot(n, h), 0.0), material.factors.z) * material.factors.y;
    let ambient = light.ambient.rgb * material.factors.x;
    let color = albedo.rgb * (ambient + light.color.rgb * diffuse) + light.color.rgb * specular;
    return vec4f(color, albedo.a);
}
)";

} // namespace shaders

namespace {

std::string vertexInput(MaterialSignature sig, TargetKind target) {
    std::string s = "\nstruct VertexInput {\n"
                    "    @location(0) position: vec3f,\n";
    if (sig.isTextured()) s += "    @location(1) uv: vec2f,\n";
    s += "    @location(2) normal: vec3f,\n";
    if (sig.hasNormalMap()) s += "    @location(3) tangent: vec4f,\n";
    if (target == TargetKind::Stereo) s += "    @builtin(instance_index) viewIndex: u32,\n";
    s += "}\n";
    return s;
}

std::string vertexOutput(MaterialSignature sig, TargetKind target) {
    std::string s = "\nstruct VertexOutput {\n"
                    "    @builtin(position) clipPosition: vec4f,\n"
                    "    @location(0) worldPosition: vec3f,\n"
                    "    @location(1) worldNormal: vec3f,\n";
    if (sig.isTextured()) s += "    @location(2) uv: vec2f,\n";
    if (sig.hasNormalMap()) s += "    @location(3) worldTangent: vec4f,\n";
    if (target == TargetKind::Stereo) s += "    @location(4) @interpolate(flat) viewIndex: u32,\n";
    s += "}\n";
    return s;
}

std::string vertexMain(MaterialSignature sig, TargetKind target) {
    std::string s = "\n@vertex\n"
                    "fn vs_main(in: VertexInput) -> VertexOutput {\n"
                    "    var out: VertexOutput;\n"
                    "    let world = transform.model * vec4f(in.position, 1.0);\n"
                    "    out.worldPosition = world.xyz;\n"
                    "    out.worldNormal = normalize((transform.model * vec4f(in.normal, 0.0)).xyz);\n";
    if (target == TargetKind::Stereo) {
        s += "    let eye = min(in.viewIndex, 1u);\n"
             "    out.clipPosition = camera.viewProjection[eye] * world;\n"
             "    out.viewIndex = eye;\n";
    } else {
        s += "    out.clipPosition = camera.viewProjection * world;\n";
    }
    if (sig.isTextured()) s += "    out.uv = in.uv;\n";
    if (sig.hasNormalMap()) {
        s += "    let t = normalize((transform.model * vec4f(in.tangent.xyz, 0.0)).xyz);\n"
             "    out.worldTangent = vec4f(t, in.tangent.w);\n";
    }
    s += "    return out;\n"
         "}\n";
    return s;
}

std::string fragmentMain(MaterialSignature sig, TargetKind target) {
    std::string s = "\n@fragment\n"
                    "fn fs_main(in: VertexOutput) -> @location(0) vec4f {\n"
                    "    var albedo = material.baseColor;\n";
    if (sig.hasDiffuseTexture()) {
        s += "    albedo = albedo * textureSample(diffuseTexture, diffuseSampler, in.uv);\n";
    }
    s += "    var n = normalize(in.worldNormal);\n";
    if (sig.hasNormalMap()) {
        // Gram-Schmidt, then rebuild the bitangent from the handedness sign
        s += "    let t = normalize(in.worldTangent.xyz - n * dot(n, in.worldTangent.xyz));\n"
             "    let b = cross(n, t) * in.worldTangent.w;\n"
             "    var ts = textureSample(normalTexture, normalSampler, in.uv).xyz * 2.0 - 1.0;\n"
             "    ts = vec3f(ts.xy * material.factors.w, ts.z);\n"
             "    n = normalize(mat3x3f(t, b, n) * ts);\n";
    }
    if (target == TargetKind::Stereo) {
        s += "    let eyePosition = camera.eyePosition[in.viewIndex].xyz;\n";
    } else {
        s += "    let eyePosition = camera.position.xyz;\n";
    }
    s += "    return shade(albedo, n, in.worldPosition, eyePosition);\n"
         "}\n";
    return s;
}

} // anonymous namespace

std::string ShaderLibrary::builtinSource(MaterialSignature signature, TargetKind target) {
    std::string src;
    src += target == TargetKind::Stereo ? shaders::CAMERA_STEREO : shaders::CAMERA_MONO;
    src += shaders::UNIFORM_STRUCTS;
    if (signature.hasDiffuseTexture()) src += shaders::DIFFUSE_BINDINGS;
    if (signature.hasNormalMap()) src += shaders::NORMAL_BINDINGS;
    src += vertexInput(signature, target);
    src += vertexOutput(signature, target);
    src += shaders::LIGHTING;
    src += vertexMain(signature, target);
    src += fragmentMain(signature, target);
    return src;
}

std::string ShaderLibrary::source(MaterialSignature signature, TargetKind target) const {
    const auto& custom = m_overrides[slot(signature, target)];
    if (custom) return *custom;
    return builtinSource(signature, target);
}

void ShaderLibrary::setOverride(MaterialSignature signature, TargetKind target, std::string wgsl) {
    m_overrides[slot(signature, target)] = std::move(wgsl);
}

void ShaderLibrary::clearOverrides() {
    for (auto& o : m_overrides) o.reset();
}

} // namespace lumen
