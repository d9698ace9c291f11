// -*-c++-*-
#ifndef CONFORMIX_COPYRIGHT_H
#define CONFORMIX_COPYRIGHT_H

//-------------------------------------------------------------------------------------------------
// conformix: conformational ensembles, weighted superposition, and RMSD analysis
//
// This file is included by every source and header in the library so that the notice travels
// with each translation unit.  The code is distributed under the terms of the MIT license.
//-------------------------------------------------------------------------------------------------

#endif
