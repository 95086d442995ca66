export module TSpline;

export import :Types;
export import :Error;
export import :TMesh;
export import :KnotInference;
export import :Validation;
export import :Basis;
export import :Nurbs;
export import :Evaluator;
export import :Surface;
export import :Tessellation;
export import :Shapes;
