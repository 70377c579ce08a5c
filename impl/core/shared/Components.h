#pragma once

#ifndef COMPONENTS_H
#define COMPONENTS_H

#include "MdsError.h"
#include "../lexer/MdsLexer.h"
#include "../parser/MdsParser.h"
#include "../docgen/HtmlTreeBuilder.h"
#include "../docgen/HtmlDocGen.h"
#include "../site/SiteConfig.h"
#include "../site/SiteBuilder.h"

#endif
