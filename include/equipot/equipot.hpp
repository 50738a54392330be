// filename: equipot.hpp
// part of Equipotential Surface Mesher
// MIT License

#pragma once

#include "field.hpp"
#include "grid.hpp"
#include "ingest.hpp"
#include "io_csv.hpp"
#include "io_obj.hpp"
#include "io_vtk.hpp"
#include "marching_cubes.hpp"
#include "mc_tables.hpp"
#include "mesh.hpp"
#include "types.hpp"
